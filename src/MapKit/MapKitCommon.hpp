#ifndef MAPKITCOMMON_HPP
#define MAPKITCOMMON_HPP

#include <atomic>
#include <cstddef>     // std::size_t
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>

struct MemoryStats {
    std::size_t total_nodes{};
    std::size_t max_depth{};
    std::size_t total_buckets{};
    std::size_t used_buckets{};
};

inline std::string to_string(const MemoryStats& stats) {
    return fmt::format("nodes={} depth={} buckets={}/{}",
                       stats.total_nodes, stats.max_depth, stats.used_buckets, stats.total_buckets);
}

// Value slot of the set variants.
using Unit = std::monostate;

/**
 * How bulk construction and merging resolve a key that appears twice.
 */
enum struct DuplicatePolicy : std::uint8_t {
    Reject    = 0, // throw DuplicateKey
    KeepFirst = 1,
    KeepLast  = 2,
};

class DuplicateKey : public std::runtime_error {
    std::size_t position_;

public:
    DuplicateKey(std::string_view operation, std::size_t position)
        : std::runtime_error{fmt::format("{}: duplicate key at position {}", operation, position)}
        , position_{position} {}

    std::size_t position() const noexcept { return position_; }
};

class IncompatibleComparator : public std::runtime_error {
    std::uint64_t lhs_;
    std::uint64_t rhs_;

public:
    IncompatibleComparator(std::string_view operation, std::uint64_t lhs, std::uint64_t rhs)
        : std::runtime_error{fmt::format("{}: operands were built with different comparators (#{} vs #{})",
                                         operation, lhs, rhs)}
        , lhs_{lhs}
        , rhs_{rhs} {}

    std::uint64_t lhs_id() const noexcept { return lhs_; }
    std::uint64_t rhs_id() const noexcept { return rhs_; }
};

// Identity ids are only used in diagnostics; identity itself is the address of the shared state.
inline std::uint64_t mint_identity() noexcept {
    static std::atomic<std::uint64_t> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

template<typename S>
inline void require_same_identity(std::string_view operation, const S& lhs, const S& rhs) {
    if (!lhs.same_identity(rhs)) {
        throw IncompatibleComparator{operation, lhs.id(), rhs.id()};
    }
}

#endif // MAPKITCOMMON_HPP
