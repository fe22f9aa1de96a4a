#ifndef HASHER_HPP
#define HASHER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "Comparator.hpp"
#include "MapKitCommon.hpp"

/**
 * @brief Hash function, equality and bucket order bundled under one identity
 *
 * Hashtables index buckets with `hash` and keep each bucket as a small search tree
 * ordered by `bucket_order`, so colliding keys cost a logarithmic walk instead of a
 * list scan. `equal(a, b)` must imply `hash(a) == hash(b)` and that `bucket_order`
 * treats a and b as equivalent; a hasher breaking this contract loses entries.
 */
template<typename K>
class Hasher {
public:
    using key_type = K;
    using hash_function = std::function<std::size_t(const K&)>;
    using equal_function = std::function<bool(const K&, const K&)>;

private:
    struct state_t {
        hash_function hash;
        equal_function equal;
        Comparator<K> order;
        std::uint64_t id;
    };

    std::shared_ptr<const state_t> state_;

    explicit Hasher(std::shared_ptr<const state_t> state) noexcept
        : state_{std::move(state)} {}

public:
    template<typename H, typename E>
        requires std::is_invocable_r_v<std::size_t, H&, const K&>
              && std::is_invocable_r_v<bool, E&, const K&, const K&>
    static Hasher from(H&& hash, E&& equal, Comparator<K> order) {
        return Hasher{std::make_shared<const state_t>(state_t{
            hash_function{std::forward<H>(hash)},
            equal_function{std::forward<E>(equal)},
            std::move(order),
            mint_identity()})};
    }

    static const Hasher& standard() {
        static const Hasher instance{from(std::hash<K>{}, std::equal_to<K>{}, Comparator<K>::standard())};
        return instance;
    }

    std::size_t hash(const K& key) const {
        return state_->hash(key);
    }

    bool equal(const K& lhs, const K& rhs) const {
        return state_->equal(lhs, rhs);
    }

    const Comparator<K>& bucket_order() const noexcept {
        return state_->order;
    }

    std::uint64_t id() const noexcept { return state_->id; }

    bool same_identity(const Hasher& other) const noexcept {
        return state_ == other.state_;
    }
};

template<typename K, typename H, typename E>
Hasher<K> make_hasher(H&& hash, E&& equal, Comparator<K> order = Comparator<K>::standard()) {
    return Hasher<K>::from(std::forward<H>(hash), std::forward<E>(equal), std::move(order));
}

#endif // HASHER_HPP
