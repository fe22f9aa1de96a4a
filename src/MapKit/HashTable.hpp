/**
 * @brief Mutable hashtable with tree-shaped buckets and a pluggable hasher
 *
 * The table layout can be visualized as shown below:
 * HashTable
 * ┌──────────────────────────────────┐
 * | hasher: Hasher<K>                | ← hash + equality + bucket order, shared identity
 * | buckets: BucketNode*[2^k]        | ← index = hash(key) & (2^k - 1)
 * | size, max_load_factor            | ← grows to 2^(k+1) when size > 2^k * max_load_factor
 * | allocated: bytes                 | ← charged by every bucket array and node allocation
 * └───────────|──────────────────────┘
 * bucket i    ▼
 * ┌──────────────────────────────────┐
 * | AVL tree of BucketNode           | ← ordered by hasher.bucket_order(), O(log n) under collisions
 * └──────────────────────────────────┘
 *
 * A table is an unsynchronized mutable object. Concurrent mutation needs external
 * locking, and reads concurrent with a mutation are undefined.
 */

#ifndef HASHTABLE_HPP
#define HASHTABLE_HPP

#include <algorithm>
#include <bit>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "Hasher.hpp"
#include "MapKitCommon.hpp"
#include "bucket_tree.hpp"
#include "allocator/tracking_allocator.hpp"

struct HashTableOptions {
    std::size_t initial_size = 16;
    double max_load_factor = 1.0;
    bool growth_allowed = true;
};

template<typename K, typename V>
class HashTable {
    using bucket_tree_t = BucketTree<K, V>;
    using node_t = typename bucket_tree_t::node_t;
    using bucket_allocator_t = tracking_allocator<node_t*>;

    Hasher<K> hasher_;
    node_t** buckets_{};
    std::size_t bucket_count_{};
    std::size_t size_{};
    double max_load_factor_{1.0};
    bool growth_allowed_{true};
    std::size_t allocated_{sizeof(*this)};

    static std::size_t bucket_count_for(std::size_t hint) noexcept {
        return std::bit_ceil(std::max<std::size_t>(hint, 1));
    }

    std::size_t index(const K& key) const {
        return hasher_.hash(key) & (bucket_count_ - 1);
    }

    // A moved-from table has no bucket array until the next insertion.
    node_t* find_node(const K& key) const {
        if (bucket_count_ == 0) return nullptr;
        return bucket_tree_t::find(buckets_[index(key)], key, hasher_);
    }

    static node_t** allocate_buckets(std::size_t count, std::size_t& alloc) {
        bucket_allocator_t a{alloc};
        node_t** buckets{a.allocate(count)};
        std::uninitialized_fill_n(buckets, count, nullptr);
        return buckets;
    }

    void destroy_storage() noexcept {
        if (buckets_ == nullptr) return;
        for (std::size_t i{0}; i < bucket_count_; ++i) {
            bucket_tree_t::destroy(buckets_[i], allocated_);
        }
        bucket_allocator_t{allocated_}.deallocate(buckets_, bucket_count_);
        buckets_ = nullptr;
        bucket_count_ = 0;
        size_ = 0;
    }

    // Links a fresh node for an absent key and grows the table if that overloads it.
    node_t* link(const K& key, V value) {
        if (bucket_count_ == 0) {
            buckets_ = allocate_buckets(1, allocated_);
            bucket_count_ = 1;
        }
        node_t*& root{buckets_[index(key)]};
        node_t* n{bucket_tree_t::create(allocated_, key, std::move(value))};
        root = bucket_tree_t::insert(root, n, hasher_);
        ++size_;
        maybe_grow();
        return n;
    }

    void maybe_grow() {
        if (growth_allowed_ &&
            static_cast<double>(size_) > static_cast<double>(bucket_count_) * max_load_factor_) {
            rehash(bucket_count_ * 2);
        }
    }

    // Relinks every node into a new bucket array; nodes are not reallocated, so references
    // handed out by `find_or_add` stay valid.
    void rehash(std::size_t new_count) {
        node_t** fresh{allocate_buckets(new_count, allocated_)};
        const std::size_t mask{new_count - 1};
        auto relink{[&](node_t* n) {
            node_t*& root{fresh[hasher_.hash(n->entry.first) & mask]};
            root = bucket_tree_t::insert(root, n, hasher_);
        }};
        for (std::size_t i{0}; i < bucket_count_; ++i) {
            bucket_tree_t::drain(std::exchange(buckets_[i], nullptr), relink);
        }
        bucket_allocator_t{allocated_}.deallocate(buckets_, bucket_count_);
        buckets_ = fresh;
        bucket_count_ = new_count;
    }

    struct exact_size_t {};

    HashTable(const Hasher<K>& hasher, std::size_t bucket_count, double max_load_factor,
              bool growth_allowed, exact_size_t)
        : hasher_{hasher}
        , bucket_count_{bucket_count}
        , max_load_factor_{max_load_factor}
        , growth_allowed_{growth_allowed} {
        buckets_ = allocate_buckets(bucket_count_, allocated_);
    }

public:
    using key_type = K;
    using mapped_type = V;
    using value_type = std::pair<const K, V>;
    using size_type = std::size_t;

    class Iterator {
        const HashTable* table_{};
        std::size_t bucket_{};
        std::vector<const node_t*> stack_;

        void settle() {
            while (stack_.empty() && table_ != nullptr && bucket_ < table_->bucket_count_) {
                bucket_tree_t::push_left_spine(stack_, table_->buckets_[bucket_]);
                ++bucket_;
            }
        }

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<const K, V>;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        Iterator() = default;

        explicit Iterator(const HashTable* table) : table_{table} {
            settle();
        }

        Iterator& operator++() {
            const node_t* n{stack_.back()};
            stack_.pop_back();
            bucket_tree_t::push_left_spine(stack_, n->right);
            settle();
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp{*this};
            ++*this;
            return tmp;
        }

        reference operator*() const {
            return stack_.back()->entry;
        }

        pointer operator->() const {
            return &stack_.back()->entry;
        }

        bool operator==(const Iterator& other) const {
            if (stack_.empty() || other.stack_.empty()) {
                return stack_.empty() == other.stack_.empty();
            }
            return stack_.back() == other.stack_.back();
        }
    };

    using iterator = Iterator;
    using const_iterator = Iterator;

    /**
     * @brief Constructs an empty table
     * @throws std::invalid_argument if `options.max_load_factor` is not positive
     */
    explicit HashTable(Hasher<K> hasher = Hasher<K>::standard(), HashTableOptions options = {})
        : hasher_{std::move(hasher)}
        , bucket_count_{bucket_count_for(options.initial_size)}
        , max_load_factor_{options.max_load_factor}
        , growth_allowed_{options.growth_allowed} {
        if (!(options.max_load_factor > 0.0)) {
            throw std::invalid_argument{
                fmt::format("HashTable: max_load_factor must be positive, got {}", options.max_load_factor)};
        }
        buckets_ = allocate_buckets(bucket_count_, allocated_);
    }

    /**
     * @brief Constructs an empty table sized for about `initial_size_hint` entries
     */
    HashTable(Hasher<K> hasher, std::size_t initial_size_hint)
        : HashTable{std::move(hasher), HashTableOptions{.initial_size = initial_size_hint}} {}

    // Copying walks every bucket; ask for it explicitly with `copy()`.
    HashTable(const HashTable&) = delete;
    HashTable& operator=(const HashTable&) = delete;

    HashTable(HashTable&& other) noexcept
        : hasher_{other.hasher_}
        , buckets_{std::exchange(other.buckets_, nullptr)}
        , bucket_count_{std::exchange(other.bucket_count_, 0)}
        , size_{std::exchange(other.size_, 0)}
        , max_load_factor_{other.max_load_factor_}
        , growth_allowed_{other.growth_allowed_}
        , allocated_{std::exchange(other.allocated_, sizeof other)} {
    }

    HashTable& operator=(HashTable&& other) noexcept {
        if (this != &other) {
            destroy_storage();
            hasher_ = other.hasher_;
            buckets_ = std::exchange(other.buckets_, nullptr);
            bucket_count_ = std::exchange(other.bucket_count_, 0);
            size_ = std::exchange(other.size_, 0);
            max_load_factor_ = other.max_load_factor_;
            growth_allowed_ = other.growth_allowed_;
            allocated_ = std::exchange(other.allocated_, sizeof other);
        }
        return *this;
    }

    ~HashTable() {
        destroy_storage();
    }

    /**
     * @brief Deep copy with its own bucket array and nodes, sharing only the hasher
     */
    [[nodiscard]] HashTable copy() const {
        HashTable result{hasher_, bucket_count_for(bucket_count_), max_load_factor_, growth_allowed_, exact_size_t{}};
        for (std::size_t i{0}; i < bucket_count_; ++i) {
            result.buckets_[i] = bucket_tree_t::clone(buckets_[i], result.allocated_);
        }
        result.size_ = size_;
        return result;
    }

    std::optional<V> find(const K& key) const {
        if (const auto* n{find_node(key)}; n != nullptr) {
            return n->entry.second;
        }
        return std::nullopt;
    }

    bool contains(const K& key) const {
        return find_node(key) != nullptr;
    }

    /**
     * @brief Binds `key` to `value`, replacing any previous binding
     *
     * Time complexity: O(1) amortized
     */
    void set(const K& key, V value) {
        if (auto* n{find_node(key)}; n != nullptr) {
            n->entry.second = std::move(value);
            return;
        }
        link(key, std::move(value));
    }

    /**
     * @brief Binds `key` to `value` only if `key` is absent
     * @return true if the binding was added
     */
    bool add(const K& key, V value) {
        if (find_node(key) != nullptr) {
            return false;
        }
        link(key, std::move(value));
        return true;
    }

    /**
     * @return true if a binding was removed
     */
    bool remove(const K& key) {
        if (bucket_count_ == 0) {
            return false;
        }
        node_t*& root{buckets_[index(key)]};
        node_t* removed{nullptr};
        root = bucket_tree_t::erase(root, key, hasher_, removed);
        if (removed == nullptr) {
            return false;
        }
        bucket_tree_t::release(removed, allocated_);
        --size_;
        return true;
    }

    /**
     * @brief Applies `f` to the current value of `key` (nullopt when absent)
     *
     * A returned value is stored under `key`; a returned nullopt removes the binding.
     * `f` sees a copy, so the table is unchanged if `f` throws.
     */
    template<typename F>
    void change(const K& key, F&& f) {
        node_t* n{find_node(key)};
        std::optional<V> current;
        if (n != nullptr) {
            current = n->entry.second;
        }
        std::optional<V> next{std::forward<F>(f)(std::move(current))};
        if (next.has_value()) {
            if (n != nullptr) {
                n->entry.second = std::move(*next);
            } else {
                link(key, std::move(*next));
            }
        } else if (n != nullptr) {
            remove(key);
        }
    }

    /**
     * @brief Like `change`, for functions that always produce a value
     */
    template<typename F>
    void update(const K& key, F&& f) {
        change(key, [&](std::optional<V> current) {
            return std::optional<V>{std::forward<F>(f)(std::move(current))};
        });
    }

    /**
     * @brief Returns the value bound to `key`, first binding it to `make()` if absent
     *
     * The reference stays valid until the binding is removed or the table destroyed;
     * growing the table does not move entries.
     */
    template<typename F>
    V& find_or_add(const K& key, F&& make) {
        if (auto* n{find_node(key)}; n != nullptr) {
            return n->entry.second;
        }
        return link(key, std::forward<F>(make)())->entry.second;
    }

    /**
     * @brief Removes every binding, keeping the bucket array
     */
    void clear() noexcept {
        for (std::size_t i{0}; i < bucket_count_; ++i) {
            bucket_tree_t::destroy(std::exchange(buckets_[i], nullptr), allocated_);
        }
        size_ = 0;
    }

    std::size_t size() const noexcept {
        return size_;
    }

    bool empty() const noexcept {
        return size_ == 0;
    }

    std::size_t bucket_count() const noexcept {
        return bucket_count_;
    }

    double load_factor() const noexcept {
        return bucket_count_ == 0 ? 0.0 : static_cast<double>(size_) / static_cast<double>(bucket_count_);
    }

    double max_load_factor() const noexcept {
        return max_load_factor_;
    }

    const Hasher<K>& hasher() const noexcept {
        return hasher_;
    }

    template<typename Acc, typename F>
    Acc fold(Acc init, F&& f) const {
        for (const auto& [key, value] : *this) {
            init = f(std::move(init), key, value);
        }
        return init;
    }

    template<typename F>
    void for_each(F&& f) const {
        for (const auto& [key, value] : *this) {
            f(key, value);
        }
    }

    std::vector<K> keys() const {
        std::vector<K> out;
        out.reserve(size_);
        for (const auto& entry : *this) {
            out.push_back(entry.first);
        }
        return out;
    }

    std::vector<V> values() const {
        std::vector<V> out;
        out.reserve(size_);
        for (const auto& entry : *this) {
            out.push_back(entry.second);
        }
        return out;
    }

    /**
     * @brief All bindings, in unspecified order
     */
    std::vector<std::pair<K, V>> to_vector() const {
        std::vector<std::pair<K, V>> out;
        out.reserve(size_);
        for (const auto& [key, value] : *this) {
            out.emplace_back(key, value);
        }
        return out;
    }

    /**
     * @brief Bytes currently held by this table, including the table object itself
     */
    constexpr std::size_t get_allocated_bytes() const noexcept {
        return allocated_;
    }

    MemoryStats get_memory_stats() const {
        MemoryStats stats{.total_nodes = size_, .total_buckets = bucket_count_};
        for (std::size_t i{0}; i < bucket_count_; ++i) {
            if (buckets_[i] != nullptr) {
                ++stats.used_buckets;
                stats.max_depth = std::max<std::size_t>(stats.max_depth, buckets_[i]->height);
            }
        }
        return stats;
    }

    Iterator begin() const {
        return Iterator{this};
    }

    Iterator end() const {
        return Iterator{};
    }
};

#endif // HASHTABLE_HPP
