#include "mutagen/builder.hpp"

namespace mutagen {

namespace {

std::size_t marker_slot(NodeType type) {
    switch (type) {
        case NodeType::Period:    return 0;
        case NodeType::Comma:     return 1;
        case NodeType::Semicolon: return 2;
        case NodeType::Dash:      return 3;
        case NodeType::AAn:       return 4;
        default:                  return 5;  // Concat
    }
}

} // namespace

NodeIndex GrammarBuilder::literal(std::string_view text) {
    NodeIndex idx = arena_.alloc(NodeType::Literal);
    arena_[idx].data = Node::LiteralData{std::string(text)};
    return idx;
}

NodeIndex GrammarBuilder::empty() {
    return arena_.alloc(NodeType::Empty);
}

NodeIndex GrammarBuilder::sequence(std::initializer_list<NodeIndex> children) {
    return sequence(std::vector<NodeIndex>(children));
}

NodeIndex GrammarBuilder::sequence(const std::vector<NodeIndex>& children) {
    NodeIndex idx = arena_.alloc(NodeType::Sequence);
    for (NodeIndex child : children) {
        arena_.add_child(idx, child);
    }
    return idx;
}

NodeIndex GrammarBuilder::choice(std::initializer_list<NodeIndex> children) {
    return choice(std::vector<NodeIndex>(children));
}

NodeIndex GrammarBuilder::choice(const std::vector<NodeIndex>& children) {
    NodeIndex idx = arena_.alloc(NodeType::Weighted);
    for (NodeIndex child : children) {
        arena_.add_weighted_child(idx, 1, child);
    }
    return idx;
}

NodeIndex GrammarBuilder::weighted(std::initializer_list<WeightedChild> alternatives) {
    return weighted(std::vector<WeightedChild>(alternatives));
}

NodeIndex GrammarBuilder::weighted(const std::vector<WeightedChild>& alternatives) {
    NodeIndex idx = arena_.alloc(NodeType::Weighted);
    for (const auto& [weight, child] : alternatives) {
        arena_.add_weighted_child(idx, weight, child);
    }
    return idx;
}

NodeIndex GrammarBuilder::shuffle(std::initializer_list<NodeIndex> children) {
    return shuffle(std::vector<NodeIndex>(children));
}

NodeIndex GrammarBuilder::shuffle(const std::vector<NodeIndex>& children) {
    NodeIndex idx = arena_.alloc(NodeType::Shuffle);
    for (NodeIndex child : children) {
        arena_.add_child(idx, child);
    }
    return idx;
}

NodeIndex GrammarBuilder::fixed(std::string_view label, NodeIndex child) {
    NodeIndex idx = arena_.alloc(NodeType::Fixed);
    arena_[idx].data = Node::LabelData{std::string(label)};
    arena_.add_child(idx, child);
    return idx;
}

NodeIndex GrammarBuilder::marker(NodeType type) {
    auto& slot = markers_[marker_slot(type)];
    if (!slot) {
        slot = arena_.alloc(type);
    }
    return *slot;
}

} // namespace mutagen
