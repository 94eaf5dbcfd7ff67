#include "mutagen/compiler.hpp"
#include <limits>

namespace mutagen {

CompileResult Compiler::compile(const NodeArena& arena, NodeIndex root,
                                const CompileOptions& options) {
    arena_ = &arena;
    pool_ = CyclePool(options.primes);
    out_ = CompiledGrammar{};
    diagnostics_.clear();
    filename_ = std::string(options.filename);
    check_labels_ = options.check_labels;
    aborted_ = false;
    on_path_.assign(arena.size(), false);
    shuffle_slots_.clear();
    label_groups_.clear();

    CompileResult result;

    CompiledIndex compiled_root = compile_node(root, nullptr);

    result.diagnostics = std::move(diagnostics_);
    if (compiled_root == NULL_COMPILED || has_errors(result.diagnostics)) {
        result.success = false;
        return result;
    }

    out_.root = compiled_root;
    out_.shuffle_slots = static_cast<std::uint32_t>(shuffle_slots_.size());
    out_.cycles_used = pool_.allocated();
    out_.label_count = pool_.label_count();

    result.grammar = std::move(out_);
    result.success = true;
    return result;
}

CompiledIndex Compiler::compile_node(NodeIndex node, const std::string* label) {
    if (aborted_) return NULL_COMPILED;

    if (!arena_->valid(node)) {
        error(codes::InvalidNode, "Reference to a node that does not exist", {});
        return NULL_COMPILED;
    }

    const Node& n = (*arena_)[node];

    if (on_path_[node]) {
        error(codes::RecursiveNode,
              std::string(node_type_name(n.type)) +
                  " node contains itself; recursive grammars are not supported",
              n.location);
        aborted_ = true;
        return NULL_COMPILED;
    }

    on_path_[node] = true;
    CompiledIndex result = NULL_COMPILED;

    switch (n.type) {
        case NodeType::Sequence:
            result = compile_sequence(node);
            break;
        case NodeType::Weighted:
            result = compile_weighted(node, label);
            break;
        case NodeType::Shuffle:
            result = compile_shuffle(node, label);
            break;
        case NodeType::Fixed:
            result = compile_fixed(node);
            break;
        case NodeType::RuleRef:
            error(codes::InvalidNode,
                  "Unresolved rule reference '" + n.as_rule_name() + "'",
                  n.location);
            break;
        default:
            result = compile_leaf(node);
            break;
    }

    on_path_[node] = false;
    return result;
}

CompiledIndex Compiler::compile_leaf(NodeIndex node) {
    const Node& n = (*arena_)[node];

    CompiledNode leaf;
    leaf.type = n.type;
    leaf.source = node;
    if (n.type == NodeType::Literal) {
        leaf.text = n.as_literal();
    }
    return emit(std::move(leaf));
}

CompiledIndex Compiler::compile_sequence(NodeIndex node) {
    const Node& n = (*arena_)[node];

    CompiledNode seq;
    seq.type = NodeType::Sequence;
    seq.source = node;
    if (!compile_children(n.children, seq.children)) {
        return NULL_COMPILED;
    }
    return emit(std::move(seq));
}

CompiledIndex Compiler::compile_weighted(NodeIndex node, const std::string* label) {
    const Node& n = (*arena_)[node];
    const auto& weights = n.as_weights();

    if (n.children.empty()) {
        error(codes::EmptyChoice, "Weighted choice has no alternatives", n.location);
        return NULL_COMPILED;
    }
    if (weights.size() != n.children.size()) {
        error(codes::InvalidWeight,
              "Weighted choice has " + std::to_string(n.children.size()) +
                  " alternatives but " + std::to_string(weights.size()) + " weights",
              n.location);
        return NULL_COMPILED;
    }

    std::uint64_t total = 0;
    for (std::uint32_t w : weights) {
        if (w == 0) {
            error(codes::InvalidWeight, "Weights must be positive integers", n.location);
            return NULL_COMPILED;
        }
        total += w;
    }
    if (total > std::numeric_limits<std::uint32_t>::max()) {
        error(codes::InvalidWeight, "Total weight is too large", n.location);
        return NULL_COMPILED;
    }

    auto cycle = assign_cycle(node, label);
    if (!cycle) return NULL_COMPILED;

    CompiledNode choice;
    choice.type = NodeType::Weighted;
    choice.source = node;
    choice.cycle = *cycle;
    choice.total_weight = static_cast<std::uint32_t>(total);
    choice.weights = weights;
    if (!compile_children(n.children, choice.children)) {
        return NULL_COMPILED;
    }
    return emit(std::move(choice));
}

CompiledIndex Compiler::compile_shuffle(NodeIndex node, const std::string* label) {
    const Node& n = (*arena_)[node];

    if (n.children.empty()) {
        error(codes::EmptyChoice, "Shuffle has no alternatives", n.location);
        return NULL_COMPILED;
    }

    auto cycle = assign_cycle(node, label);
    if (!cycle) return NULL_COMPILED;

    CompiledNode shuffle;
    shuffle.type = NodeType::Shuffle;
    shuffle.source = node;
    shuffle.cycle = *cycle;

    // Every occurrence of one Shuffle node draws from the same deck
    auto [slot, inserted] = shuffle_slots_.try_emplace(
        node, static_cast<std::uint32_t>(shuffle_slots_.size()));
    shuffle.shuffle_slot = slot->second;

    if (!compile_children(n.children, shuffle.children)) {
        return NULL_COMPILED;
    }
    return emit(std::move(shuffle));
}

CompiledIndex Compiler::compile_fixed(NodeIndex node) {
    const Node& n = (*arena_)[node];

    if (n.children.size() != 1) {
        error(codes::InvalidNode, "Fixed node must wrap exactly one node", n.location);
        return NULL_COMPILED;
    }

    NodeIndex child = n.children[0];
    const std::string& label = n.as_label();

    if (arena_->valid(child) && is_choice((*arena_)[child].type)) {
        return compile_node(child, &label);
    }

    if (arena_->valid(child)) {
        warning(codes::LabelIgnored,
                "Label '" + label + "' has no effect on a " +
                    node_type_name((*arena_)[child].type) + " node",
                n.location);
    }
    return compile_node(child, nullptr);
}

bool Compiler::compile_children(const std::vector<NodeIndex>& children,
                                std::vector<CompiledIndex>& out) {
    bool ok = true;
    out.reserve(children.size());
    for (NodeIndex child : children) {
        CompiledIndex compiled = compile_node(child, nullptr);
        if (compiled == NULL_COMPILED) {
            ok = false;
            if (aborted_) break;
            continue;
        }
        out.push_back(compiled);
    }
    return ok;
}

std::optional<std::uint32_t> Compiler::assign_cycle(NodeIndex node, const std::string* label) {
    std::optional<std::uint32_t> cycle;
    if (label) {
        check_label_group(*label, node);
        cycle = pool_.allocate_for_label(*label);
    } else {
        cycle = pool_.allocate();
    }

    if (!cycle) {
        error(codes::PoolExhausted,
              "Out of cycle primes: the grammar has more than " +
                  std::to_string(pool_.allocated()) + " choice points",
              (*arena_)[node].location);
        aborted_ = true;
    }
    return cycle;
}

void Compiler::check_label_group(const std::string& label, NodeIndex node) {
    if (!check_labels_) return;

    const Node& n = (*arena_)[node];
    std::vector<std::uint32_t> weights;
    if (n.type == NodeType::Weighted) {
        weights = n.as_weights();
    }

    auto [it, inserted] = label_groups_.try_emplace(label, LabelGroup{
        .type = n.type,
        .weights = weights,
        .arity = n.children.size(),
        .location = n.location,
        .reported = false
    });
    if (inserted) return;

    LabelGroup& group = it->second;
    if (group.reported) return;

    std::string mismatch;
    if (group.type != n.type) {
        mismatch = std::string("a ") + node_type_name(n.type) + " where the label's first node is a " +
                   node_type_name(group.type);
    } else if (group.arity != n.children.size()) {
        mismatch = std::to_string(n.children.size()) + " alternatives where the label's first node has " +
                   std::to_string(group.arity);
    } else if (group.weights != weights) {
        mismatch = "different weights from the label's first node";
    }
    if (mismatch.empty()) return;

    group.reported = true;
    Diagnostic diag{
        .severity = Severity::Warning,
        .code = std::string(codes::LabelMismatch),
        .message = "Label '" + label + "' is shared by mismatched nodes: " + mismatch +
                   "; selections will not line up",
        .filename = filename_,
        .location = n.location
    };
    diag.related.push_back(Diagnostic::Related{
        .message = "first node labeled '" + label + "' is here",
        .filename = filename_,
        .location = group.location
    });
    diagnostics_.push_back(std::move(diag));
}

CompiledIndex Compiler::emit(CompiledNode node) {
    CompiledIndex idx = static_cast<CompiledIndex>(out_.nodes.size());
    out_.nodes.push_back(std::move(node));
    return idx;
}

void Compiler::error(std::string_view code, std::string message, SourceLocation loc) {
    diagnostics_.push_back(Diagnostic{
        .severity = Severity::Error,
        .code = std::string(code),
        .message = std::move(message),
        .filename = filename_,
        .location = loc
    });
}

void Compiler::warning(std::string_view code, std::string message, SourceLocation loc) {
    diagnostics_.push_back(Diagnostic{
        .severity = Severity::Warning,
        .code = std::string(code),
        .message = std::move(message),
        .filename = filename_,
        .location = loc
    });
}

CompileResult compile(const NodeArena& arena, NodeIndex root,
                      const CompileOptions& options) {
    Compiler compiler;
    return compiler.compile(arena, root, options);
}

} // namespace mutagen
