#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <variant>
#include "diagnostics.hpp"

namespace mutagen {

/// Index into the node arena (0xFFFFFFFF = null/invalid)
using NodeIndex = std::uint32_t;
constexpr NodeIndex NULL_NODE = 0xFFFFFFFF;

/// Generative node types
enum class NodeType : std::uint8_t {
    // Text
    Literal,        // Emits its text unchanged
    Empty,          // Emits nothing

    // Structure
    Sequence,       // Emits every child in order
    Weighted,       // Emits one child, chosen by weight
    Shuffle,        // Emits one child, without replacement within a seed
    Fixed,          // Shares its child's modulus with all nodes of the same label

    // Control markers (consumed by the assembler)
    Period,
    Comma,
    Semicolon,
    Dash,
    AAn,            // "a" or "an" depending on the next word
    Concat,         // Suppresses the space before the next word

    // Grammar front end only
    RuleRef,        // Unresolved -rule- reference
};

/// Convert node type to string for debugging
constexpr const char* node_type_name(NodeType type) {
    switch (type) {
        case NodeType::Literal:   return "Literal";
        case NodeType::Empty:     return "Empty";
        case NodeType::Sequence:  return "Sequence";
        case NodeType::Weighted:  return "Weighted";
        case NodeType::Shuffle:   return "Shuffle";
        case NodeType::Fixed:     return "Fixed";
        case NodeType::Period:    return "Period";
        case NodeType::Comma:     return "Comma";
        case NodeType::Semicolon: return "Semicolon";
        case NodeType::Dash:      return "Dash";
        case NodeType::AAn:       return "AAn";
        case NodeType::Concat:    return "Concat";
        case NodeType::RuleRef:   return "RuleRef";
    }
    return "Unknown";
}

/// True for the node types that select between children and need a cycle
constexpr bool is_choice(NodeType type) {
    return type == NodeType::Weighted || type == NodeType::Shuffle;
}

/// Grammar node - stored in a contiguous arena
///
/// Children are held by index. A node may be listed as the child of several
/// parents (a rule used in more than one place), so the arena describes a
/// DAG rather than a strict tree.
struct Node {
    NodeType type;
    SourceLocation location;

    std::vector<NodeIndex> children;

    struct LiteralData { std::string text; };
    struct WeightData { std::vector<std::uint32_t> weights; };  // Parallel to children
    struct LabelData { std::string label; };
    struct RuleRefData { std::string name; };

    std::variant<
        std::monostate,
        LiteralData,
        WeightData,
        LabelData,
        RuleRefData
    > data;

    [[nodiscard]] const std::string& as_literal() const {
        return std::get<LiteralData>(data).text;
    }

    [[nodiscard]] const std::vector<std::uint32_t>& as_weights() const {
        return std::get<WeightData>(data).weights;
    }

    [[nodiscard]] const std::string& as_label() const {
        return std::get<LabelData>(data).label;
    }

    [[nodiscard]] const std::string& as_rule_name() const {
        return std::get<RuleRefData>(data).name;
    }
};

/// Arena-based node storage
class NodeArena {
public:
    NodeArena() {
        nodes_.reserve(128);
    }

    /// Allocate a new node, returns its index
    NodeIndex alloc(NodeType type, SourceLocation loc = {}) {
        NodeIndex idx = static_cast<NodeIndex>(nodes_.size());
        nodes_.push_back(Node{
            .type = type,
            .location = loc,
            .children = {},
            .data = std::monostate{}
        });
        if (type == NodeType::Weighted) {
            nodes_.back().data = Node::WeightData{};
        }
        return idx;
    }

    [[nodiscard]] Node& operator[](NodeIndex idx) {
        return nodes_[idx];
    }

    [[nodiscard]] const Node& operator[](NodeIndex idx) const {
        return nodes_[idx];
    }

    [[nodiscard]] std::size_t size() const {
        return nodes_.size();
    }

    [[nodiscard]] bool valid(NodeIndex idx) const {
        return idx != NULL_NODE && idx < nodes_.size();
    }

    /// Append a child (order is significant)
    void add_child(NodeIndex parent, NodeIndex child) {
        nodes_[parent].children.push_back(child);
    }

    /// Append a weighted alternative to a Weighted node
    void add_weighted_child(NodeIndex parent, std::uint32_t weight, NodeIndex child) {
        auto& node = nodes_[parent];
        node.children.push_back(child);
        std::get<Node::WeightData>(node.data).weights.push_back(weight);
    }

private:
    std::vector<Node> nodes_;
};

} // namespace mutagen
