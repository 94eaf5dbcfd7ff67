#include "mutagen/assembler.hpp"
#include <cctype>

namespace mutagen {

bool starts_with_vowel(std::string_view word) {
    if (word.empty()) return false;
    switch (std::tolower(static_cast<unsigned char>(word.front()))) {
        case 'a':
        case 'e':
        case 'i':
        case 'o':
        case 'u':
            return true;
        default:
            return false;
    }
}

void TextAssembler::push(const OutputToken& token) {
    switch (token.kind) {
        case TokenKind::Period:
            mode_ = AssemblyMode::NewSentence;
            break;
        case TokenKind::Comma:
            if (mode_ == AssemblyMode::Interword) {
                mode_ = AssemblyMode::Comma;
            }
            break;
        case TokenKind::Dash:
            if (mode_ == AssemblyMode::Interword || mode_ == AssemblyMode::Comma) {
                mode_ = AssemblyMode::Dash;
            }
            break;
        case TokenKind::Semicolon:
            if (mode_ == AssemblyMode::Interword || mode_ == AssemblyMode::Comma ||
                mode_ == AssemblyMode::Dash) {
                mode_ = AssemblyMode::Semicolon;
            }
            break;
        case TokenKind::Concat:
            mode_ = AssemblyMode::Concat;
            break;
        case TokenKind::AAn:
            push_word("a", AssemblyMode::AAn);
            break;
        case TokenKind::Word:
            if (!token.text.empty()) {
                push_word(token.text, AssemblyMode::Interword);
            }
            break;
    }
}

void TextAssembler::push_word(std::string_view word, AssemblyMode next_mode) {
    switch (mode_) {
        case AssemblyMode::Beginning:
        case AssemblyMode::Concat:
            break;
        case AssemblyMode::NewSentence:
            out_ += ". ";
            break;
        case AssemblyMode::Interword:
            out_ += ' ';
            break;
        case AssemblyMode::Comma:
            out_ += ", ";
            break;
        case AssemblyMode::Semicolon:
            out_ += "; ";
            break;
        case AssemblyMode::Dash:
            out_ += " -- ";
            break;
        case AssemblyMode::AAn:
            // The pending "a" becomes "an" before a vowel
            if (starts_with_vowel(word)) {
                out_ += 'n';
            }
            out_ += ' ';
            break;
    }

    const bool capitalize = mode_ == AssemblyMode::Beginning ||
                            mode_ == AssemblyMode::NewSentence;
    std::size_t start = out_.size();
    out_ += word;
    if (capitalize) {
        out_[start] = static_cast<char>(std::toupper(static_cast<unsigned char>(out_[start])));
    }

    mode_ = next_mode;
}

std::string TextAssembler::finish() {
    if (mode_ != AssemblyMode::Beginning && mode_ != AssemblyMode::NewSentence) {
        out_ += '.';
    }
    std::string text = std::move(out_);
    out_.clear();
    mode_ = AssemblyMode::Beginning;
    return text;
}

std::string assemble(std::span<const OutputToken> tokens) {
    TextAssembler assembler;
    for (const auto& token : tokens) {
        assembler.push(token);
    }
    return assembler.finish();
}

} // namespace mutagen
