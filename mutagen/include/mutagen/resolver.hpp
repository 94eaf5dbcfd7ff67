#pragma once

#include "diagnostics.hpp"
#include "grammar_parser.hpp"
#include "rule_table.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mutagen {

/// Result of rule resolution
struct ResolveResult {
    Grammar grammar;               // Rule bodies with every reference linked
    RuleTable rules;               // Rule table after resolution
    std::vector<Diagnostic> diagnostics;
    bool success = false;
};

/// Links -rule- references to the bodies they name
///
/// Two passes:
/// 1. Collect definitions: register every rule, reporting duplicates
/// 2. Resolve: depth first over the rules, replacing each RuleRef child with
///    the referenced rule's resolved body (or the builtin marker node)
///
/// A rule used in several places ends up as a child of several parents; the
/// arena becomes a DAG. Recursive rules are rejected because generation
/// would never terminate.
class RuleResolver {
public:
    /// Resolve a parsed grammar
    /// @param grammar The parsed grammar (RuleRef nodes still in place)
    /// @param filename Filename for error reporting
    ResolveResult resolve(Grammar grammar, std::string_view filename = "<input>");

private:
    enum class VisitState : std::uint8_t { Unvisited, InProgress, Done };

    // Pass 1
    void collect_definitions();

    // Pass 2
    void resolve_rule(std::size_t rule_index);
    NodeIndex resolve_node(NodeIndex node);
    NodeIndex resolve_reference(NodeIndex ref);

    /// Shared node standing in for a builtin rule
    NodeIndex builtin_node(NodeType type) const;

    /// "-a- -> -b- -> -a-" for the rules on the current path
    std::string describe_cycle(std::size_t rule_index) const;

    void error(std::string_view code, std::string message, SourceLocation loc);

    Grammar grammar_;
    RuleTable rules_;
    std::vector<Diagnostic> diagnostics_;
    std::string filename_;

    std::vector<VisitState> state_;
    std::vector<NodeIndex> resolved_;   // Resolved body per rule
    std::vector<std::size_t> path_;     // Rules currently being resolved
    NodeIndex aan_node_ = NULL_NODE;
    NodeIndex concat_node_ = NULL_NODE;
    NodeIndex empty_node_ = NULL_NODE;
};

/// Convenience function to resolve a parsed grammar
ResolveResult resolve_rules(Grammar grammar, std::string_view filename = "<input>");

} // namespace mutagen
