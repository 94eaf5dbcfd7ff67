#include "mutagen/rule_table.hpp"
#include <array>
#include <utility>

namespace mutagen {

namespace {

// Sentence starts are always capitalized, so -capitalize- emits nothing
constexpr std::array<std::pair<std::string_view, NodeType>, 5> BUILTIN_RULES = {{
    {"-a-",          NodeType::AAn},
    {"-an-",         NodeType::AAn},
    {"-a-an-",       NodeType::AAn},
    {"-adjoining-",  NodeType::Concat},
    {"-capitalize-", NodeType::Empty},
}};

} // namespace

RuleTable::RuleTable() {
    register_builtins();
}

void RuleTable::register_builtins() {
    for (const auto& [name, type] : BUILTIN_RULES) {
        RuleEntry entry{};
        entry.kind = RuleKind::Builtin;
        entry.name = std::string(name);
        entry.builtin = type;
        rules_.insert_or_assign(entry.name, entry);
    }
}

bool RuleTable::define(std::string_view name, std::size_t rule_index, SourceLocation loc) {
    auto it = rules_.find(std::string(name));
    if (it != rules_.end() && it->second.kind == RuleKind::User) {
        return false;
    }

    RuleEntry entry{};
    entry.kind = RuleKind::User;
    entry.name = std::string(name);
    entry.rule_index = rule_index;
    entry.location = loc;
    rules_.insert_or_assign(entry.name, entry);
    ++user_rules_;
    return true;
}

std::optional<RuleEntry> RuleTable::find(std::string_view name) const {
    auto it = rules_.find(std::string(name));
    if (it != rules_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool RuleTable::is_builtin_name(std::string_view name) {
    for (const auto& builtin : BUILTIN_RULES) {
        if (builtin.first == name) {
            return true;
        }
    }
    return false;
}

} // namespace mutagen
