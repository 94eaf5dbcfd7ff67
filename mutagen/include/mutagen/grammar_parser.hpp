#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "grammar_token.hpp"
#include "node.hpp"
#include "diagnostics.hpp"

namespace mutagen {

/// A named rule of a grammar
struct RuleDef {
    std::string name;           // Including the dashes: "-gorey-fate-"
    NodeIndex body = NULL_NODE;
    SourceLocation location;    // Location of the name
};

/// Rules plus the arena holding their bodies
struct Grammar {
    NodeArena arena;
    std::vector<RuleDef> rules;  // Declaration order

    /// Body of the named rule, or NULL_NODE
    [[nodiscard]] NodeIndex find_rule(std::string_view name) const {
        for (const auto& rule : rules) {
            if (rule.name == name) {
                return rule.body;
            }
        }
        return NULL_NODE;
    }

    [[nodiscard]] bool valid() const {
        return !rules.empty();
    }
};

/// Recursive descent parser for the grammar notation
///
///     grammar     := rule*
///     rule        := NAME '=' expression
///     expression  := alternative ('/' alternative)*
///     alternative := ('[' NUMBER ']')? sequence
///     sequence    := factor*
///     factor      := NAME | punct | '(' expression ')'
///                  | '{' expression '}' | WORD '{' expression '}' | WORD
///
/// A rule ends where the next `NAME =` begins. References stay RuleRef nodes
/// until the RuleResolver links them.
class GrammarParser {
public:
    /// @param tokens Tokens from the grammar lexer (must end with Eof)
    /// @param filename Filename for error reporting
    explicit GrammarParser(std::vector<GrammarToken> tokens,
                           std::string_view filename = "<input>");

    /// Parse every rule (check diagnostics for errors)
    [[nodiscard]] Grammar parse();

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const {
        return diagnostics_;
    }

    [[nodiscard]] bool has_errors() const {
        return mutagen::has_errors(diagnostics_);
    }

private:
    /// One alternative of an expression
    struct Alternative {
        std::uint32_t weight = 1;
        bool explicit_weight = false;
        NodeIndex node = NULL_NODE;
        SourceLocation location;
        SourceLocation weight_location;     // "[n]" including brackets
    };

    // Token navigation
    [[nodiscard]] const GrammarToken& current() const;
    [[nodiscard]] const GrammarToken& previous() const;
    [[nodiscard]] const GrammarToken& peek_next() const;
    [[nodiscard]] bool is_at_end() const;
    [[nodiscard]] bool check(GrammarTokenType type) const;
    [[nodiscard]] bool match(GrammarTokenType type);
    const GrammarToken& advance();
    const GrammarToken& consume(GrammarTokenType type, std::string_view message);

    /// True at `NAME =`, where the next rule starts
    [[nodiscard]] bool at_rule_start() const;

    /// True at a token that cannot continue a sequence
    [[nodiscard]] bool at_sequence_end() const;

    // Error handling
    void error(std::string_view message);
    void error_at(const GrammarToken& token, std::string_view message);
    void warning_at(std::string_view code, SourceLocation loc, std::string message,
                    std::optional<Diagnostic::Fix> fix = std::nullopt);
    void synchronize();

    // Grammar structure
    void parse_rule(Grammar& grammar);
    NodeIndex parse_expression();
    std::vector<Alternative> parse_alternatives();
    Alternative parse_alternative();
    NodeIndex parse_sequence();
    NodeIndex parse_factor();

    // Factors
    NodeIndex parse_group();
    NodeIndex parse_shuffle();
    NodeIndex parse_fixed(const GrammarToken& label);
    NodeIndex parse_punctuation(NodeType type);

    /// Weighted node from alternatives
    NodeIndex make_choice(const std::vector<Alternative>& alternatives, SourceLocation loc);

    NodeIndex make_node(NodeType type, const GrammarToken& token);

    std::vector<GrammarToken> tokens_;
    std::string filename_;
    std::vector<Diagnostic> diagnostics_;
    NodeArena arena_;

    std::size_t current_idx_ = 0;
    bool panic_mode_ = false;
};

/// Convenience function to parse grammar tokens
/// @return Pair of grammar and diagnostics
std::pair<Grammar, std::vector<Diagnostic>>
parse_grammar(std::vector<GrammarToken> tokens, std::string_view filename = "<input>");

} // namespace mutagen
