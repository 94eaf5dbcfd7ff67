#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include "diagnostics.hpp"

namespace mutagen {

/// Token types for the grammar notation
enum class GrammarTokenType : std::uint8_t {
    Eof,

    RuleName,       // -gorey-fate-
    Word,           // mysterious, St, o'clock
    Number,         // 2 (a weight inside [ ], a word elsewhere)

    Equals,         // =
    Slash,          // / (alternative separator)
    LParen,         // (
    RParen,         // )
    LBrace,         // {
    RBrace,         // }
    LBracket,       // [
    RBracket,       // ]

    Period,         // .
    Comma,          // ,
    Semicolon,      // ;
    Dash,           // -- (followed by whitespace)

    Error,
};

constexpr std::string_view grammar_token_type_name(GrammarTokenType type) {
    switch (type) {
        case GrammarTokenType::Eof:       return "Eof";
        case GrammarTokenType::RuleName:  return "RuleName";
        case GrammarTokenType::Word:      return "Word";
        case GrammarTokenType::Number:    return "Number";
        case GrammarTokenType::Equals:    return "Equals";
        case GrammarTokenType::Slash:     return "Slash";
        case GrammarTokenType::LParen:    return "LParen";
        case GrammarTokenType::RParen:    return "RParen";
        case GrammarTokenType::LBrace:    return "LBrace";
        case GrammarTokenType::RBrace:    return "RBrace";
        case GrammarTokenType::LBracket:  return "LBracket";
        case GrammarTokenType::RBracket:  return "RBracket";
        case GrammarTokenType::Period:    return "Period";
        case GrammarTokenType::Comma:     return "Comma";
        case GrammarTokenType::Semicolon: return "Semicolon";
        case GrammarTokenType::Dash:      return "Dash";
        case GrammarTokenType::Error:     return "Error";
    }
    return "Unknown";
}

/// Token value: a number, an error message, or nothing
using GrammarTokenValue = std::variant<std::monostate, std::uint32_t, std::string>;

/// A single token from the grammar lexer
struct GrammarToken {
    GrammarTokenType type = GrammarTokenType::Eof;
    SourceLocation location{};
    std::string_view lexeme{};  // View into source (valid while source exists)
    GrammarTokenValue value{};

    [[nodiscard]] bool is_error() const { return type == GrammarTokenType::Error; }

    [[nodiscard]] bool is_eof() const { return type == GrammarTokenType::Eof; }

    /// Word-like tokens can appear as literal text
    [[nodiscard]] bool is_text() const {
        return type == GrammarTokenType::Word || type == GrammarTokenType::Number;
    }

    /// Get numeric value (assumes type == Number)
    [[nodiscard]] std::uint32_t as_number() const {
        return std::get<std::uint32_t>(value);
    }

    /// Get error message (assumes type == Error)
    [[nodiscard]] const std::string& as_error() const {
        return std::get<std::string>(value);
    }
};

} // namespace mutagen
