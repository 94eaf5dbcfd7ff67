#include "mutagen/evaluator.hpp"
#include <utility>

namespace mutagen {

namespace {

TokenKind marker_token(NodeType type) {
    switch (type) {
        case NodeType::Period:    return TokenKind::Period;
        case NodeType::Comma:     return TokenKind::Comma;
        case NodeType::Semicolon: return TokenKind::Semicolon;
        case NodeType::Dash:      return TokenKind::Dash;
        case NodeType::AAn:       return TokenKind::AAn;
        default:                  return TokenKind::Concat;
    }
}

} // namespace

std::size_t select_weighted(std::span<const std::uint32_t> weights,
                            std::uint32_t total_weight,
                            std::uint32_t cycle, std::uint64_t seed) {
    std::uint64_t value = (seed % cycle) % total_weight;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (value < weights[i]) {
            return i;
        }
        value -= weights[i];
    }
    // Unreachable while total_weight is the sum of weights
    return weights.size() - 1;
}

void shuffle_order(std::vector<CompiledIndex>& order, std::uint32_t cycle,
                   std::uint64_t seed) {
    const std::uint64_t count = order.size();
    for (std::uint64_t i = 0; i < count; ++i) {
        std::uint64_t j = (seed % (static_cast<std::uint64_t>(cycle) + 2 * i)) % count;
        std::swap(order[i], order[j]);
    }
}

Evaluator::Evaluator(const CompiledGrammar& grammar, GenerationState& state)
    : grammar_(grammar)
    , state_(state)
{
    state_.reserve_slots(grammar_.shuffle_slots);
}

void Evaluator::evaluate(std::uint64_t seed, std::vector<OutputToken>& out) {
    if (!grammar_.valid()) return;
    eval_node(grammar_.root, seed, out);
}

std::vector<OutputToken> Evaluator::evaluate(std::uint64_t seed) {
    std::vector<OutputToken> out;
    evaluate(seed, out);
    return out;
}

void Evaluator::eval_node(CompiledIndex idx, std::uint64_t seed,
                          std::vector<OutputToken>& out) {
    const CompiledNode& node = grammar_[idx];

    switch (node.type) {
        case NodeType::Literal:
            if (!node.text.empty()) {
                out.push_back(OutputToken{.kind = TokenKind::Word, .text = node.text});
            }
            break;
        case NodeType::Sequence:
            for (CompiledIndex child : node.children) {
                eval_node(child, seed, out);
            }
            break;
        case NodeType::Weighted:
            eval_weighted(node, seed, out);
            break;
        case NodeType::Shuffle:
            eval_shuffle(node, seed, out);
            break;
        case NodeType::Period:
        case NodeType::Comma:
        case NodeType::Semicolon:
        case NodeType::Dash:
        case NodeType::AAn:
        case NodeType::Concat:
            out.push_back(OutputToken{.kind = marker_token(node.type)});
            break;
        default:
            // Empty (Fixed and RuleRef never reach a compiled grammar)
            break;
    }
}

void Evaluator::eval_weighted(const CompiledNode& node, std::uint64_t seed,
                              std::vector<OutputToken>& out) {
    std::size_t pick = select_weighted(node.weights, node.total_weight, node.cycle, seed);
    eval_node(node.children[pick], seed, out);
}

void Evaluator::eval_shuffle(const CompiledNode& node, std::uint64_t seed,
                             std::vector<OutputToken>& out) {
    ShuffleState& state = state_.shuffle(node.shuffle_slot);

    if (!state.last_seed || *state.last_seed != seed) {
        state.pending.clear();
        state.last_seed = seed;
    }
    if (state.pending.empty()) {
        state.pending = node.children;
        shuffle_order(state.pending, node.cycle, seed);
    }

    CompiledIndex pick = state.pending.back();
    state.pending.pop_back();
    eval_node(pick, seed, out);
}

std::vector<OutputToken>
evaluate_tokens(const CompiledGrammar& grammar, std::uint64_t seed, GenerationState& state) {
    Evaluator evaluator(grammar, state);
    return evaluator.evaluate(seed);
}

} // namespace mutagen
