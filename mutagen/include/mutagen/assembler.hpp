#pragma once

#include "evaluator.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace mutagen {

/// What separates the previous word from the next one
///
/// Punctuation only ever strengthens the pending separator:
/// Period > Semicolon > Dash > Comma > Interword.
enum class AssemblyMode : std::uint8_t {
    Beginning,      // Nothing emitted yet
    NewSentence,    // ". " then a capital
    Interword,      // " "
    Comma,          // ", "
    Semicolon,      // "; "
    Dash,           // " -- "
    AAn,            // Previous word was the a/an marker
    Concat,         // No separator
};

constexpr const char* assembly_mode_name(AssemblyMode mode) {
    switch (mode) {
        case AssemblyMode::Beginning:   return "Beginning";
        case AssemblyMode::NewSentence: return "NewSentence";
        case AssemblyMode::Interword:   return "Interword";
        case AssemblyMode::Comma:       return "Comma";
        case AssemblyMode::Semicolon:   return "Semicolon";
        case AssemblyMode::Dash:        return "Dash";
        case AssemblyMode::AAn:         return "AAn";
        case AssemblyMode::Concat:      return "Concat";
    }
    return "Unknown";
}

/// True if the word starts with a, e, i, o or u (either case)
[[nodiscard]] bool starts_with_vowel(std::string_view word);

/// Turns a token stream into punctuated, capitalized prose
///
/// Push tokens in order, then call finish(). Separators are written lazily,
/// just before the next word, which is what lets a later, stronger mark
/// replace a weaker pending one and lets the a/an marker look at the word
/// that follows it.
class TextAssembler {
public:
    void push(const OutputToken& token);

    /// Append the closing period if needed and return the text
    /// The assembler is reset afterwards.
    [[nodiscard]] std::string finish();

    [[nodiscard]] AssemblyMode mode() const { return mode_; }

private:
    void push_word(std::string_view word, AssemblyMode next_mode);

    std::string out_;
    AssemblyMode mode_ = AssemblyMode::Beginning;
};

/// Convenience function: assemble a complete token stream
[[nodiscard]] std::string assemble(std::span<const OutputToken> tokens);

} // namespace mutagen
