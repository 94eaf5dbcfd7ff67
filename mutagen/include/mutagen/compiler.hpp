#pragma once

#include "cycle_pool.hpp"
#include "diagnostics.hpp"
#include "node.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mutagen {

/// Index into CompiledGrammar::nodes (0xFFFFFFFF = null/invalid)
using CompiledIndex = std::uint32_t;
constexpr CompiledIndex NULL_COMPILED = 0xFFFFFFFF;

/// Shuffle slot marker for nodes that are not Shuffles
constexpr std::uint32_t NO_SHUFFLE_SLOT = 0xFFFFFFFF;

/// A node bound to its cycle and to the compiled forms of its children
///
/// Fixed nodes do not survive compilation: their child carries the shared
/// cycle and takes their place.
struct CompiledNode {
    NodeType type = NodeType::Empty;
    std::uint32_t cycle = 0;                   // Weighted/Shuffle only
    std::uint32_t total_weight = 0;            // Weighted only
    std::uint32_t shuffle_slot = NO_SHUFFLE_SLOT;
    std::vector<CompiledIndex> children;
    std::vector<std::uint32_t> weights;        // Weighted only, parallel to children
    std::string text;                          // Literal only
    NodeIndex source = NULL_NODE;              // Originating arena node
};

/// Result of compiling one root node
struct CompiledGrammar {
    std::vector<CompiledNode> nodes;
    CompiledIndex root = NULL_COMPILED;
    std::uint32_t shuffle_slots = 0;   // Distinct Shuffle source nodes
    std::size_t cycles_used = 0;       // Primes consumed from the pool
    std::size_t label_count = 0;       // Distinct Fixed labels

    [[nodiscard]] bool valid() const {
        return root != NULL_COMPILED && root < nodes.size();
    }

    [[nodiscard]] const CompiledNode& operator[](CompiledIndex idx) const {
        return nodes[idx];
    }
};

/// Compilation settings
struct CompileOptions {
    /// Cycle primes, consumed from the back
    std::span<const std::uint32_t> primes = default_primes();

    /// Filename attached to diagnostics
    std::string_view filename = "<nodes>";

    /// Warn when nodes sharing a label differ in kind, arity or weights
    bool check_labels = true;
};

/// Compilation result
struct CompileResult {
    bool success = false;
    CompiledGrammar grammar;
    std::vector<Diagnostic> diagnostics;
};

/// Node tree compiler
///
/// Walks the tree once, depth first. Weighted and Shuffle nodes take a cycle
/// from the pool before their children are compiled, so cycles are assigned
/// in pre-order. A node reachable through several parents is compiled once
/// per occurrence and receives one cycle per occurrence; all occurrences of
/// a Shuffle share one state slot.
class Compiler {
public:
    /// Compile the tree rooted at `root`
    /// @param arena Arena holding the tree (must contain no RuleRef nodes)
    /// @param root Root node
    /// @param options Pool, filename and validation settings
    /// @return Compiled grammar and diagnostics (grammar is empty on failure)
    CompileResult compile(const NodeArena& arena, NodeIndex root,
                          const CompileOptions& options = {});

private:
    CompiledIndex compile_node(NodeIndex node, const std::string* label);
    CompiledIndex compile_leaf(NodeIndex node);
    CompiledIndex compile_sequence(NodeIndex node);
    CompiledIndex compile_weighted(NodeIndex node, const std::string* label);
    CompiledIndex compile_shuffle(NodeIndex node, const std::string* label);
    CompiledIndex compile_fixed(NodeIndex node);

    /// Compile `children` into `out`; false if any child failed
    bool compile_children(const std::vector<NodeIndex>& children,
                          std::vector<CompiledIndex>& out);

    /// Take a cycle for a choice node (labeled or not)
    std::optional<std::uint32_t> assign_cycle(NodeIndex node, const std::string* label);

    /// Record a labeled node and warn if it disagrees with the label's group
    void check_label_group(const std::string& label, NodeIndex node);

    CompiledIndex emit(CompiledNode node);

    void error(std::string_view code, std::string message, SourceLocation loc);
    void warning(std::string_view code, std::string message, SourceLocation loc);

    /// Shape of the first node seen with a label
    struct LabelGroup {
        NodeType type;
        std::vector<std::uint32_t> weights;
        std::size_t arity;
        SourceLocation location;
        bool reported = false;
    };

    const NodeArena* arena_ = nullptr;
    CyclePool pool_;
    CompiledGrammar out_;
    std::vector<Diagnostic> diagnostics_;
    std::string filename_;
    bool check_labels_ = true;
    bool aborted_ = false;

    std::vector<bool> on_path_;  // Nodes on the current recursion path
    std::unordered_map<NodeIndex, std::uint32_t> shuffle_slots_;
    std::unordered_map<std::string, LabelGroup> label_groups_;
};

/// Convenience function to compile a node tree
CompileResult compile(const NodeArena& arena, NodeIndex root,
                      const CompileOptions& options = {});

} // namespace mutagen
