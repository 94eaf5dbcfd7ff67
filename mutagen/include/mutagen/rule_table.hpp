#pragma once

#include "node.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mutagen {

/// FNV-1a 32-bit hash of a rule name
inline std::uint32_t fnv1a_hash(std::string_view str) noexcept {
    std::uint32_t hash = 2166136261u;  // FNV-1a 32-bit offset basis
    for (char c : str) {
        hash ^= static_cast<std::uint32_t>(static_cast<unsigned char>(c));
        hash *= 16777619u;  // FNV-1a 32-bit prime
    }
    return hash;
}

/// Rule kinds
enum class RuleKind : std::uint8_t {
    User,       // Defined in the grammar text
    Builtin,    // -a-, -an-, -a-an-, -adjoining-, -capitalize-
};

/// Rule entry in the rule table
struct RuleEntry {
    RuleKind kind = RuleKind::User;
    std::string name;              // Including the dashes: "-a-an-"

    // Only valid if kind == User: index into Grammar::rules
    std::size_t rule_index = 0;
    SourceLocation location;

    // Only valid if kind == Builtin: the node type the name stands for
    NodeType builtin = NodeType::Empty;
};

/// Rule names visible to a grammar
///
/// Keyed by the full name (FNV-1a buckets, names compared on lookup).
/// Starts out holding the builtins. A user rule may shadow a builtin but
/// not another user rule.
class RuleTable {
public:
    RuleTable();

    /// Define a user rule
    /// Returns false if a user rule of that name already exists
    bool define(std::string_view name, std::size_t rule_index, SourceLocation loc);

    /// Lookup a rule by name
    [[nodiscard]] std::optional<RuleEntry> find(std::string_view name) const;

    /// Number of user rules defined
    [[nodiscard]] std::size_t user_rule_count() const { return user_rules_; }

    /// True if `name` is one of the builtin rule names
    [[nodiscard]] static bool is_builtin_name(std::string_view name);

private:
    struct NameHash {
        std::size_t operator()(const std::string& name) const noexcept {
            return fnv1a_hash(name);
        }
    };

    std::unordered_map<std::string, RuleEntry, NameHash> rules_;
    std::size_t user_rules_ = 0;

    /// Pre-populate with builtins
    void register_builtins();
};

} // namespace mutagen
