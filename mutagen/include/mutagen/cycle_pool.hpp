#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mutagen {

/// The built-in stock of cycle primes (940 entries, ascending)
std::span<const std::uint32_t> default_primes();

/// Finite pool of prime moduli handed out to choice points
///
/// Primes are consumed from the back of the list, one per allocate() call,
/// and never handed out twice. Labeled requests go through a label map so
/// every node carrying the same label receives the same prime. A pool lives
/// for one compilation only.
class CyclePool {
public:
    /// Pool seeded with default_primes()
    CyclePool();

    /// Pool seeded with a caller-supplied list (consumed from the back)
    explicit CyclePool(std::span<const std::uint32_t> primes);

    /// Pop the next prime
    /// @return The prime, or nullopt if the pool is exhausted
    [[nodiscard]] std::optional<std::uint32_t> allocate();

    /// Prime for a label: the cached one, or a freshly allocated one
    /// @return The prime, or nullopt if a fresh prime was needed and none remain
    [[nodiscard]] std::optional<std::uint32_t> allocate_for_label(std::string_view label);

    /// Prime already assigned to a label, if any
    [[nodiscard]] std::optional<std::uint32_t> label_cycle(std::string_view label) const;

    /// Primes still available
    [[nodiscard]] std::size_t remaining() const { return primes_.size(); }

    /// Primes handed out so far
    [[nodiscard]] std::size_t allocated() const { return allocated_; }

    /// Number of distinct labels seen
    [[nodiscard]] std::size_t label_count() const { return labels_.size(); }

private:
    std::vector<std::uint32_t> primes_;
    std::unordered_map<std::string, std::uint32_t> labels_;
    std::size_t allocated_ = 0;
};

} // namespace mutagen
