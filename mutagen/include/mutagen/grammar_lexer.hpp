#pragma once

#include <string_view>
#include <vector>
#include <cstdint>
#include <utility>
#include "grammar_token.hpp"
#include "diagnostics.hpp"

namespace mutagen {

/// Lexer for the grammar notation
///
///     # comment
///     -name- = [2] word -other-rule- , / { shuffled / words } / label{ a / b }
///
/// Rule names are dash-delimited (`-a-an-`); words are runs of letters,
/// digits and apostrophes; `--` is a dash only when followed by whitespace.
/// Lexing continues after errors so every bad character is reported.
class GrammarLexer {
public:
    /// @param source Grammar text (must remain valid while tokens are used)
    /// @param filename Filename for error reporting
    explicit GrammarLexer(std::string_view source, std::string_view filename = "<input>");

    /// Lex all tokens from the source
    /// @return Vector of tokens, ending with Eof token
    [[nodiscard]] std::vector<GrammarToken> lex_all();

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    [[nodiscard]] bool has_errors() const;

private:
    // Source navigation
    [[nodiscard]] bool is_at_end() const;
    [[nodiscard]] char peek() const;
    [[nodiscard]] char peek_next() const;
    char advance();

    // Character classification
    [[nodiscard]] static bool is_word_char(char c);
    [[nodiscard]] static bool is_digit(char c);
    [[nodiscard]] static bool is_whitespace(char c);

    // Token creation
    GrammarToken make_token(GrammarTokenType type);
    GrammarToken make_token(GrammarTokenType type, GrammarTokenValue value);
    GrammarToken make_error_token(std::string_view code, std::string_view message);

    // Lexing helpers
    void skip_whitespace_and_comments();
    GrammarToken lex_token();
    GrammarToken lex_word();
    GrammarToken lex_dash_or_rule_name();

    void update_location(char c);

    std::string_view source_;
    std::string filename_;
    std::vector<Diagnostic> diagnostics_;

    std::uint32_t start_ = 0;
    std::uint32_t current_ = 0;
    std::uint32_t line_ = 1;
    std::uint32_t column_ = 1;

    std::uint32_t token_line_ = 1;
    std::uint32_t token_column_ = 1;
};

/// Convenience function to lex grammar text
/// @return Pair of tokens and diagnostics
std::pair<std::vector<GrammarToken>, std::vector<Diagnostic>>
lex_grammar(std::string_view source, std::string_view filename = "<input>");

} // namespace mutagen
