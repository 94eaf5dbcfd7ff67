#include "mutagen/grammar_lexer.hpp"
#include <charconv>

namespace mutagen {

GrammarLexer::GrammarLexer(std::string_view source, std::string_view filename)
    : source_(source)
    , filename_(filename)
{}

std::vector<GrammarToken> GrammarLexer::lex_all() {
    std::vector<GrammarToken> tokens;
    tokens.reserve(source_.size() / 4);

    while (true) {
        GrammarToken tok = lex_token();
        tokens.push_back(tok);
        if (tok.type == GrammarTokenType::Eof) {
            break;
        }
    }

    return tokens;
}

bool GrammarLexer::has_errors() const {
    return mutagen::has_errors(diagnostics_);
}

bool GrammarLexer::is_at_end() const {
    return current_ >= source_.size();
}

char GrammarLexer::peek() const {
    if (is_at_end()) return '\0';
    return source_[current_];
}

char GrammarLexer::peek_next() const {
    if (current_ + 1 >= source_.size()) return '\0';
    return source_[current_ + 1];
}

char GrammarLexer::advance() {
    char c = source_[current_++];
    update_location(c);
    return c;
}

bool GrammarLexer::is_word_char(char c) {
    // Bytes >= 0x80 belong to UTF-8 sequences and are kept inside words
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == '\'' ||
           (static_cast<unsigned char>(c) & 0x80) != 0;
}

bool GrammarLexer::is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool GrammarLexer::is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

GrammarToken GrammarLexer::make_token(GrammarTokenType type) {
    return GrammarToken{
        .type = type,
        .location = {
            .line = token_line_,
            .column = token_column_,
            .offset = start_,
            .length = current_ - start_
        },
        .lexeme = source_.substr(start_, current_ - start_),
        .value = {}
    };
}

GrammarToken GrammarLexer::make_token(GrammarTokenType type, GrammarTokenValue value) {
    GrammarToken tok = make_token(type);
    tok.value = std::move(value);
    return tok;
}

GrammarToken GrammarLexer::make_error_token(std::string_view code, std::string_view message) {
    GrammarToken tok = make_token(GrammarTokenType::Error, std::string(message));
    diagnostics_.push_back(Diagnostic{
        .severity = Severity::Error,
        .code = std::string(code),
        .message = std::string(message),
        .filename = filename_,
        .location = tok.location
    });
    return tok;
}

void GrammarLexer::skip_whitespace_and_comments() {
    while (!is_at_end()) {
        char c = peek();
        if (is_whitespace(c)) {
            advance();
        } else if (c == '#') {
            while (!is_at_end() && peek() != '\n') {
                advance();
            }
        } else {
            return;
        }
    }
}

GrammarToken GrammarLexer::lex_token() {
    skip_whitespace_and_comments();

    start_ = current_;
    token_line_ = line_;
    token_column_ = column_;

    if (is_at_end()) {
        return make_token(GrammarTokenType::Eof);
    }

    char c = peek();

    if (is_word_char(c)) {
        return lex_word();
    }

    if (c == '-') {
        return lex_dash_or_rule_name();
    }

    advance();
    switch (c) {
        case '=': return make_token(GrammarTokenType::Equals);
        case '/': return make_token(GrammarTokenType::Slash);
        case '(': return make_token(GrammarTokenType::LParen);
        case ')': return make_token(GrammarTokenType::RParen);
        case '{': return make_token(GrammarTokenType::LBrace);
        case '}': return make_token(GrammarTokenType::RBrace);
        case '[': return make_token(GrammarTokenType::LBracket);
        case ']': return make_token(GrammarTokenType::RBracket);
        case '.': return make_token(GrammarTokenType::Period);
        case ',': return make_token(GrammarTokenType::Comma);
        case ';': return make_token(GrammarTokenType::Semicolon);
        default:
            return make_error_token(codes::UnexpectedChar,
                                    std::string("Unexpected character '") + c + "'");
    }
}

GrammarToken GrammarLexer::lex_word() {
    bool all_digits = true;
    while (!is_at_end() && is_word_char(peek())) {
        all_digits = all_digits && is_digit(peek());
        advance();
    }

    if (!all_digits) {
        return make_token(GrammarTokenType::Word);
    }

    std::string_view digits = source_.substr(start_, current_ - start_);
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{}) {
        // Too long for a weight, still fine as literal text
        return make_token(GrammarTokenType::Word);
    }
    return make_token(GrammarTokenType::Number, value);
}

GrammarToken GrammarLexer::lex_dash_or_rule_name() {
    advance();  // leading '-'

    // "--" is a dash only when it stands alone
    if (peek() == '-') {
        char after = current_ + 1 < source_.size() ? source_[current_ + 1] : ' ';
        if (is_whitespace(after)) {
            advance();
            return make_token(GrammarTokenType::Dash);
        }
    }

    // Longest run of name characters, cut back to its last '-'
    std::uint32_t run_end = current_;
    std::uint32_t last_dash = 0;
    while (run_end < source_.size() &&
           (is_word_char(source_[run_end]) || source_[run_end] == '-')) {
        if (source_[run_end] == '-' && run_end > start_ + 1) {
            last_dash = run_end;
        }
        ++run_end;
    }

    if (last_dash == 0) {
        while (current_ < run_end) {
            advance();
        }
        return make_error_token(codes::BadRuleName,
                                "Malformed rule name: expected '-name-'");
    }

    while (current_ <= last_dash) {
        advance();
    }
    return make_token(GrammarTokenType::RuleName);
}

void GrammarLexer::update_location(char c) {
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
}

std::pair<std::vector<GrammarToken>, std::vector<Diagnostic>>
lex_grammar(std::string_view source, std::string_view filename) {
    GrammarLexer lexer(source, filename);
    auto tokens = lexer.lex_all();
    return {std::move(tokens), lexer.diagnostics()};
}

} // namespace mutagen
