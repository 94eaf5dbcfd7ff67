#include "mutagen/resolver.hpp"

namespace mutagen {

ResolveResult RuleResolver::resolve(Grammar grammar, std::string_view filename) {
    grammar_ = std::move(grammar);
    rules_ = RuleTable{};
    diagnostics_.clear();
    filename_ = std::string(filename);
    path_.clear();

    std::size_t count = grammar_.rules.size();
    state_.assign(count, VisitState::Unvisited);
    resolved_.assign(count, NULL_NODE);

    // Pass 1: Collect definitions
    collect_definitions();

    // Builtin nodes are allocated up front so the arena does not grow
    // while nodes are being rewritten
    aan_node_ = grammar_.arena.alloc(NodeType::AAn);
    concat_node_ = grammar_.arena.alloc(NodeType::Concat);
    empty_node_ = grammar_.arena.alloc(NodeType::Empty);

    // Pass 2: Resolve every rule, used or not, so all errors surface
    for (std::size_t i = 0; i < count; ++i) {
        if (state_[i] == VisitState::Unvisited) {
            resolve_rule(i);
        }
    }

    for (std::size_t i = 0; i < count; ++i) {
        grammar_.rules[i].body = resolved_[i];
    }

    ResolveResult result;
    result.success = !has_errors(diagnostics_);
    result.grammar = std::move(grammar_);
    result.rules = std::move(rules_);
    result.diagnostics = std::move(diagnostics_);
    return result;
}

void RuleResolver::collect_definitions() {
    for (std::size_t i = 0; i < grammar_.rules.size(); ++i) {
        const RuleDef& rule = grammar_.rules[i];
        if (rules_.define(rule.name, i, rule.location)) {
            continue;
        }

        auto first = rules_.find(rule.name);
        Diagnostic diag{
            .severity = Severity::Error,
            .code = std::string(codes::DuplicateRule),
            .message = "Rule " + rule.name + " is already defined",
            .filename = filename_,
            .location = rule.location
        };
        if (first) {
            diag.related.push_back({
                .message = "first defined here",
                .filename = filename_,
                .location = first->location
            });
        }
        diagnostics_.push_back(std::move(diag));
    }
}

void RuleResolver::resolve_rule(std::size_t rule_index) {
    state_[rule_index] = VisitState::InProgress;
    path_.push_back(rule_index);

    resolved_[rule_index] = resolve_node(grammar_.rules[rule_index].body);

    path_.pop_back();
    state_[rule_index] = VisitState::Done;
}

NodeIndex RuleResolver::resolve_node(NodeIndex node) {
    if (!grammar_.arena.valid(node)) {
        return node;
    }

    if (grammar_.arena[node].type == NodeType::RuleRef) {
        return resolve_reference(node);
    }

    // Index loop: children are rewritten in place
    for (std::size_t i = 0; i < grammar_.arena[node].children.size(); ++i) {
        NodeIndex child = grammar_.arena[node].children[i];
        grammar_.arena[node].children[i] = resolve_node(child);
    }
    return node;
}

NodeIndex RuleResolver::resolve_reference(NodeIndex ref) {
    const Node& node = grammar_.arena[ref];
    const std::string& name = node.as_rule_name();

    auto entry = rules_.find(name);
    if (!entry) {
        error(codes::UndefinedRule, "Undefined rule " + name, node.location);
        return ref;
    }

    if (entry->kind == RuleKind::Builtin) {
        return builtin_node(entry->builtin);
    }

    std::size_t target = entry->rule_index;
    switch (state_[target]) {
        case VisitState::Done:
            return resolved_[target];

        case VisitState::InProgress:
            error(codes::RecursiveRule,
                  "Rule " + name + " refers to itself: " + describe_cycle(target),
                  node.location);
            return ref;

        case VisitState::Unvisited:
            resolve_rule(target);
            return resolved_[target];
    }
    return ref;
}

NodeIndex RuleResolver::builtin_node(NodeType type) const {
    switch (type) {
        case NodeType::AAn:    return aan_node_;
        case NodeType::Concat: return concat_node_;
        default:               return empty_node_;
    }
}

std::string RuleResolver::describe_cycle(std::size_t rule_index) const {
    std::string chain;
    bool in_cycle = false;
    for (std::size_t idx : path_) {
        if (idx == rule_index) {
            in_cycle = true;
        }
        if (in_cycle) {
            chain += grammar_.rules[idx].name;
            chain += " -> ";
        }
    }
    chain += grammar_.rules[rule_index].name;
    return chain;
}

void RuleResolver::error(std::string_view code, std::string message, SourceLocation loc) {
    diagnostics_.push_back(Diagnostic{
        .severity = Severity::Error,
        .code = std::string(code),
        .message = std::move(message),
        .filename = filename_,
        .location = loc
    });
}

ResolveResult resolve_rules(Grammar grammar, std::string_view filename) {
    RuleResolver resolver;
    return resolver.resolve(std::move(grammar), filename);
}

} // namespace mutagen
