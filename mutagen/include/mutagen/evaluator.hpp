#pragma once

#include "compiler.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace mutagen {

/// Kinds of token produced by the evaluator
enum class TokenKind : std::uint8_t {
    Word,
    Period,
    Comma,
    Semicolon,
    Dash,
    AAn,
    Concat,
};

constexpr const char* token_kind_name(TokenKind kind) {
    switch (kind) {
        case TokenKind::Word:      return "Word";
        case TokenKind::Period:    return "Period";
        case TokenKind::Comma:     return "Comma";
        case TokenKind::Semicolon: return "Semicolon";
        case TokenKind::Dash:      return "Dash";
        case TokenKind::AAn:       return "AAn";
        case TokenKind::Concat:    return "Concat";
    }
    return "Unknown";
}

/// One evaluator output token
///
/// `text` is set for words only and views into the CompiledGrammar, so it
/// is valid as long as the grammar is.
struct OutputToken {
    TokenKind kind = TokenKind::Word;
    std::string_view text{};

    [[nodiscard]] bool is_word() const { return kind == TokenKind::Word; }

    bool operator==(const OutputToken&) const = default;
};

/// Per-Shuffle memo: the seed last drawn for and the undrawn children
struct ShuffleState {
    std::optional<std::uint64_t> last_seed;
    std::vector<CompiledIndex> pending;
};

/// Mutable state of one generation session
///
/// Holds one ShuffleState per Shuffle slot of a compiled grammar. Reusing a
/// session across calls with the same seed continues each Shuffle's deck;
/// calling with a different seed reshuffles. Separate sessions are fully
/// independent, so one compiled grammar can serve several threads as long
/// as each thread brings its own session.
class GenerationState {
public:
    GenerationState() = default;
    explicit GenerationState(std::size_t shuffle_slots)
        : shuffles_(shuffle_slots) {}

    [[nodiscard]] ShuffleState& shuffle(std::uint32_t slot) {
        return shuffles_[slot];
    }

    [[nodiscard]] const ShuffleState& shuffle(std::uint32_t slot) const {
        return shuffles_[slot];
    }

    [[nodiscard]] std::size_t size() const { return shuffles_.size(); }

    /// Grow to at least `shuffle_slots` slots (existing state is kept)
    void reserve_slots(std::size_t shuffle_slots) {
        if (shuffles_.size() < shuffle_slots) {
            shuffles_.resize(shuffle_slots);
        }
    }

    /// Forget every Shuffle's memo
    void reset() {
        for (auto& s : shuffles_) {
            s = ShuffleState{};
        }
    }

private:
    std::vector<ShuffleState> shuffles_;
};

/// Pick the alternative of a weighted choice for a seed
///
/// Computes `(seed % cycle) % total` and walks the weights, subtracting
/// each, until the remainder falls inside one.
/// @return Index into `weights`
[[nodiscard]] std::size_t select_weighted(std::span<const std::uint32_t> weights,
                                          std::uint32_t total_weight,
                                          std::uint32_t cycle, std::uint64_t seed);

/// Seeded swap pass used to refill a Shuffle's deck
///
/// For each position i, swaps order[i] with order[(seed % (cycle + 2i)) % N].
void shuffle_order(std::vector<CompiledIndex>& order, std::uint32_t cycle,
                   std::uint64_t seed);

/// Walks a compiled grammar for a seed, producing a flat token stream
class Evaluator {
public:
    /// @param grammar Compiled grammar (must be valid)
    /// @param state Session whose Shuffle memos are read and updated
    Evaluator(const CompiledGrammar& grammar, GenerationState& state);

    /// Append the tokens for `seed` to `out`
    void evaluate(std::uint64_t seed, std::vector<OutputToken>& out);

    /// Tokens for `seed`
    [[nodiscard]] std::vector<OutputToken> evaluate(std::uint64_t seed);

private:
    void eval_node(CompiledIndex idx, std::uint64_t seed, std::vector<OutputToken>& out);
    void eval_weighted(const CompiledNode& node, std::uint64_t seed,
                       std::vector<OutputToken>& out);
    void eval_shuffle(const CompiledNode& node, std::uint64_t seed,
                      std::vector<OutputToken>& out);

    const CompiledGrammar& grammar_;
    GenerationState& state_;
};

/// Convenience function to evaluate a compiled grammar
[[nodiscard]] std::vector<OutputToken>
evaluate_tokens(const CompiledGrammar& grammar, std::uint64_t seed, GenerationState& state);

} // namespace mutagen
