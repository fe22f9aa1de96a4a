/**
 * @brief Identity-bearing total orders for ordered containers
 *
 * A Comparator is a cheap handle to an immutable, shared ordering. Copies of a handle
 * share one identity; every call to `Comparator::from` mints a new one. Ordered
 * containers carry the handle they were built with and refuse to combine with a
 * container carrying a different identity, even when the two orderings happen to
 * agree.
 */

#ifndef COMPARATOR_HPP
#define COMPARATOR_HPP

#include <compare>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "MapKitCommon.hpp"

template<typename K>
class Comparator {
public:
    using key_type = K;
    using function_type = std::function<std::weak_ordering(const K&, const K&)>;

private:
    struct state_t {
        function_type compare;
        std::uint64_t id;
    };

    std::shared_ptr<const state_t> state_;

    explicit Comparator(std::shared_ptr<const state_t> state) noexcept
        : state_{std::move(state)} {}

public:
    /**
     * @brief Wraps a three-way comparison in a fresh identity
     * @param compare Must be a strict weak order over K
     */
    template<typename F>
        requires std::is_invocable_r_v<std::weak_ordering, F&, const K&, const K&>
    static Comparator from(F&& compare) {
        return Comparator{std::make_shared<const state_t>(
            state_t{function_type{std::forward<F>(compare)}, mint_identity()})};
    }

    /**
     * @brief The process-wide comparator for `std::weak_order` over K
     *
     * All calls return handles to the same identity, so containers built with
     * default arguments can be combined with each other. Floating-point keys get
     * the IEEE total order with -0.0 and +0.0 equivalent.
     */
    static const Comparator& standard() {
        static const Comparator instance{from([](const K& lhs, const K& rhs) { return std::weak_order(lhs, rhs); })};
        return instance;
    }

    std::weak_ordering compare(const K& lhs, const K& rhs) const {
        return state_->compare(lhs, rhs);
    }

    bool less(const K& lhs, const K& rhs) const {
        return compare(lhs, rhs) < 0;
    }

    bool equivalent(const K& lhs, const K& rhs) const {
        return compare(lhs, rhs) == 0;
    }

    std::uint64_t id() const noexcept { return state_->id; }

    bool same_identity(const Comparator& other) const noexcept {
        return state_ == other.state_;
    }
};

template<typename K, typename F>
Comparator<K> make_comparator(F&& compare) {
    return Comparator<K>::from(std::forward<F>(compare));
}

#endif // COMPARATOR_HPP
