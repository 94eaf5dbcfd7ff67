#include "mutagen/debug.hpp"
#include <sstream>
#include <string_view>
#include <vector>

namespace mutagen {

namespace {

template<typename T>
void write_array(std::ostringstream& json, const std::vector<T>& values) {
    json << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) json << ",";
        json << values[i];
    }
    json << "]";
}

/// Serialize a single arena node to JSON (recursive)
void serialize_node(std::ostringstream& json, NodeIndex idx, const NodeArena& arena,
                    std::vector<bool>& on_path) {
    if (idx == NULL_NODE || !arena.valid(idx)) {
        json << "null";
        return;
    }

    const Node& node = arena[idx];
    json << "{";
    json << "\"type\":\"" << node_type_name(node.type) << "\"";

    json << ",\"location\":{\"line\":" << node.location.line
         << ",\"column\":" << node.location.column << "}";

    switch (node.type) {
        case NodeType::Literal:
            json << ",\"text\":\"" << escape_json(node.as_literal()) << "\"";
            break;
        case NodeType::Weighted:
            json << ",\"weights\":";
            write_array(json, node.as_weights());
            break;
        case NodeType::Fixed:
            json << ",\"label\":\"" << escape_json(node.as_label()) << "\"";
            break;
        case NodeType::RuleRef:
            json << ",\"rule\":\"" << escape_json(node.as_rule_name()) << "\"";
            break;
        default:
            break;
    }

    if (on_path[idx]) {
        // Cyclic arena; stop here
        json << ",\"cycle\":true}";
        return;
    }

    if (!node.children.empty()) {
        on_path[idx] = true;
        json << ",\"children\":[";
        bool first = true;
        for (NodeIndex child : node.children) {
            if (!first) json << ",";
            first = false;
            serialize_node(json, child, arena, on_path);
        }
        json << "]";
        on_path[idx] = false;
    }

    json << "}";
}

} // anonymous namespace

std::string serialize_nodes_json(NodeIndex root, const NodeArena& arena) {
    std::ostringstream json;
    std::vector<bool> on_path(arena.size(), false);
    serialize_node(json, root, arena, on_path);
    return json.str();
}

std::string serialize_compiled_json(const CompiledGrammar& grammar) {
    std::ostringstream json;
    json << "{";
    json << "\"root\":";
    if (grammar.valid()) {
        json << grammar.root;
    } else {
        json << "null";
    }
    json << ",\"cyclesUsed\":" << grammar.cycles_used;
    json << ",\"labels\":" << grammar.label_count;
    json << ",\"shuffleSlots\":" << grammar.shuffle_slots;

    json << ",\"nodes\":[";
    for (std::size_t i = 0; i < grammar.nodes.size(); ++i) {
        const CompiledNode& node = grammar.nodes[i];
        if (i > 0) json << ",";
        json << "{\"index\":" << i;
        json << ",\"type\":\"" << node_type_name(node.type) << "\"";

        switch (node.type) {
            case NodeType::Literal:
                json << ",\"text\":\"" << escape_json(node.text) << "\"";
                break;
            case NodeType::Weighted:
                json << ",\"cycle\":" << node.cycle;
                json << ",\"totalWeight\":" << node.total_weight;
                json << ",\"weights\":";
                write_array(json, node.weights);
                break;
            case NodeType::Shuffle:
                json << ",\"cycle\":" << node.cycle;
                json << ",\"slot\":" << node.shuffle_slot;
                break;
            default:
                break;
        }

        if (!node.children.empty()) {
            json << ",\"children\":";
            write_array(json, node.children);
        }
        json << "}";
    }
    json << "]}";
    return json.str();
}

} // namespace mutagen
