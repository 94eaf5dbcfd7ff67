#pragma once

#include "node.hpp"
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace mutagen {

/// A (weight, node) alternative of a Weighted node
using WeightedChild = std::pair<std::uint32_t, NodeIndex>;

/// Programmatic construction of node trees
///
/// Every method allocates into the builder's arena and returns the new
/// node's index. The control markers are shared: period() returns the same
/// node on every call.
///
///     GrammarBuilder b;
///     auto root = b.sequence({b.a_an(), b.choice({b.literal("elephant"),
///                                                 b.literal("cat")})});
///     auto result = compile(b.arena(), root);
class GrammarBuilder {
public:
    GrammarBuilder() = default;

    NodeIndex literal(std::string_view text);
    NodeIndex empty();

    NodeIndex sequence(std::initializer_list<NodeIndex> children);
    NodeIndex sequence(const std::vector<NodeIndex>& children);

    /// Uniform choice: a Weighted node with every weight 1
    NodeIndex choice(std::initializer_list<NodeIndex> children);
    NodeIndex choice(const std::vector<NodeIndex>& children);

    NodeIndex weighted(std::initializer_list<WeightedChild> alternatives);
    NodeIndex weighted(const std::vector<WeightedChild>& alternatives);

    NodeIndex shuffle(std::initializer_list<NodeIndex> children);
    NodeIndex shuffle(const std::vector<NodeIndex>& children);

    NodeIndex fixed(std::string_view label, NodeIndex child);

    NodeIndex period()    { return marker(NodeType::Period); }
    NodeIndex comma()     { return marker(NodeType::Comma); }
    NodeIndex semicolon() { return marker(NodeType::Semicolon); }
    NodeIndex dash()      { return marker(NodeType::Dash); }
    NodeIndex a_an()      { return marker(NodeType::AAn); }
    NodeIndex concat()    { return marker(NodeType::Concat); }

    [[nodiscard]] const NodeArena& arena() const { return arena_; }
    [[nodiscard]] NodeArena& arena() { return arena_; }

private:
    NodeIndex marker(NodeType type);

    NodeArena arena_;
    std::optional<NodeIndex> markers_[6];
};

} // namespace mutagen
