/**
 * @brief Persistent ordered map over an AVL tree of shared immutable nodes
 *
 * Every update returns a new map and leaves the receiver untouched. The two versions
 * share all subtrees off the updated path, so keeping old versions around is cheap and
 * comparing closely related versions (see `symmetric_diff`) only walks what differs.
 *
 * Maps never mutate a node after construction: any number of threads may read any
 * number of versions concurrently without synchronization. Node reference counts are
 * atomic, so versions may also be created and dropped from different threads.
 */

#ifndef PERSISTENTMAP_HPP
#define PERSISTENTMAP_HPP

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <ranges>
#include <utility>
#include <variant>
#include <vector>

#include "Comparator.hpp"
#include "MapKitCommon.hpp"
#include "tree_node.hpp"

template<typename V>
struct DiffLeft {
    V value;
    bool operator==(const DiffLeft&) const = default;
};

template<typename V>
struct DiffRight {
    V value;
    bool operator==(const DiffRight&) const = default;
};

template<typename V>
struct DiffUnequal {
    V left;
    V right;
    bool operator==(const DiffUnequal&) const = default;
};

/**
 * One key of a symmetric difference: present only on the left, only on the right,
 * or on both sides with values that compare unequal.
 */
template<typename K, typename V>
struct DiffEntry {
    K key;
    std::variant<DiffLeft<V>, DiffRight<V>, DiffUnequal<V>> change;
};

template<typename K, typename V>
class PersistentMap {
    using tree_t = Tree<K, V>;
    using node_t = typename tree_t::node_t;
    using ptr_t = typename tree_t::ptr_t;

    Comparator<K> comparator_;
    ptr_t root_;

    PersistentMap(Comparator<K> comparator, ptr_t root)
        : comparator_{std::move(comparator)}, root_{std::move(root)} {}

    PersistentMap with_root(ptr_t root) const {
        return PersistentMap{comparator_, std::move(root)};
    }

    static std::optional<std::pair<K, V>> binding(const node_t* n) {
        if (n == nullptr) {
            return std::nullopt;
        }
        return std::pair<K, V>{n->key, n->value};
    }

public:
    using key_type = K;
    using mapped_type = V;
    using value_type = std::pair<K, V>;
    using size_type = std::size_t;
    using diff_entry = DiffEntry<K, V>;

    /**
     * Forward iterator in ascending key order. Dereferences to a pair of references into
     * the node, which stays alive as long as the map the iterator came from.
     */
    class Iterator {
        std::vector<const node_t*> stack_;

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<K, V>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = std::pair<const K&, const V&>;

        Iterator() = default;

        explicit Iterator(const node_t* root) {
            tree_t::push_left_spine(stack_, root);
        }

        Iterator& operator++() {
            const node_t* n{stack_.back()};
            stack_.pop_back();
            tree_t::push_left_spine(stack_, n->right.get());
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp{*this};
            ++*this;
            return tmp;
        }

        reference operator*() const {
            const node_t* n{stack_.back()};
            return {n->key, n->value};
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
     * @brief Constructs an empty map ordered by `comparator`
     */
    explicit PersistentMap(Comparator<K> comparator = Comparator<K>::standard())
        : comparator_{std::move(comparator)} {}

    /**
     * @brief Builds a map from a range of key/value pairs
     * @param policy What to do when a key occurs more than once
     * @throws DuplicateKey under `DuplicatePolicy::Reject`, naming the position of the
     *         second occurrence in `pairs`
     */
    template<std::ranges::input_range R>
    static PersistentMap from_pairs(Comparator<K> comparator, R&& pairs,
                                    DuplicatePolicy policy = DuplicatePolicy::Reject) {
        ptr_t root;
        std::size_t position{0};
        for (auto&& [key, value] : pairs) {
            if (policy != DuplicatePolicy::KeepLast && tree_t::find(root, key, comparator) != nullptr) {
                if (policy == DuplicatePolicy::Reject) {
                    throw DuplicateKey{"from_pairs", position};
                }
            } else {
                root = tree_t::insert(root, key, value, comparator);
            }
            ++position;
        }
        return PersistentMap{std::move(comparator), std::move(root)};
    }

    std::optional<V> find(const K& key) const {
        const auto* n{tree_t::find(root_, key, comparator_)};
        if (n == nullptr) {
            return std::nullopt;
        }
        return n->value;
    }

    bool contains(const K& key) const {
        return tree_t::find(root_, key, comparator_) != nullptr;
    }

    /**
     * @brief Returns a map with `key` bound to `value`, replacing any previous binding
     *
     * Time complexity: O(log n), allocating O(log n) nodes
     */
    [[nodiscard]] PersistentMap insert(const K& key, const V& value) const {
        return with_root(tree_t::insert(root_, key, value, comparator_));
    }

    /**
     * @brief Returns a map without `key`
     *
     * When `key` is absent the result shares its root with this map.
     */
    [[nodiscard]] PersistentMap remove(const K& key) const {
        return with_root(tree_t::remove(root_, key, comparator_));
    }

    /**
     * @brief Rebinds `key` to `f(current value)`, or unbinds it when f returns nullopt
     */
    template<typename F>
    [[nodiscard]] PersistentMap change(const K& key, F&& f) const {
        auto current{find(key)};
        const bool present{current.has_value()};
        std::optional<V> next{std::forward<F>(f)(std::move(current))};
        if (next.has_value()) {
            return insert(key, *next);
        }
        return present ? remove(key) : *this;
    }

    /**
     * @brief Union of two maps; on a shared key `policy` picks the surviving value
     * @throws IncompatibleComparator if the maps were built with different comparators
     * @throws DuplicateKey under `DuplicatePolicy::Reject` if any key is shared; the
     *         position is that of the first shared key in `other`'s ascending order
     */
    [[nodiscard]] PersistentMap merge(const PersistentMap& other,
                                      DuplicatePolicy policy = DuplicatePolicy::KeepLast) const {
        require_same_identity("merge", comparator_, other.comparator_);
        if (policy == DuplicatePolicy::Reject) {
            std::size_t position{0};
            for (const auto& [key, value] : other) {
                if (contains(key)) {
                    throw DuplicateKey{"merge", position};
                }
                ++position;
            }
        }
        const bool prefer_this{policy == DuplicatePolicy::KeepFirst};
        return with_root(tree_t::unite(root_, other.root_, comparator_, prefer_this));
    }

    template<typename Pred>
    [[nodiscard]] PersistentMap filter(Pred pred) const {
        return with_root(tree_t::filter(root_, pred));
    }

    std::size_t size() const noexcept {
        return tree_t::count(root_);
    }

    bool empty() const noexcept {
        return !root_;
    }

    std::optional<std::pair<K, V>> min() const {
        return binding(tree_t::min_node(root_));
    }

    std::optional<std::pair<K, V>> max() const {
        return binding(tree_t::max_node(root_));
    }

    /**
     * @brief The binding with the smallest key strictly greater than `key`
     */
    std::optional<std::pair<K, V>> successor(const K& key) const {
        return binding(tree_t::successor(root_, key, comparator_));
    }

    /**
     * @brief The binding with the largest key strictly smaller than `key`
     */
    std::optional<std::pair<K, V>> predecessor(const K& key) const {
        return binding(tree_t::predecessor(root_, key, comparator_));
    }

    template<typename Acc, typename F>
    Acc fold(Acc init, F&& f) const {
        auto step{[&](const node_t& n) { init = f(std::move(init), n.key, n.value); }};
        tree_t::in_order(root_, step);
        return init;
    }

    template<typename F>
    void for_each(F&& f) const {
        auto step{[&](const node_t& n) { f(n.key, n.value); }};
        tree_t::in_order(root_, step);
    }

    /**
     * @brief All bindings, strictly ascending by the comparator
     */
    std::vector<std::pair<K, V>> to_ordered_sequence() const {
        std::vector<std::pair<K, V>> out;
        out.reserve(size());
        for_each([&](const K& k, const V& v) { out.emplace_back(k, v); });
        return out;
    }

    std::vector<K> keys() const {
        std::vector<K> out;
        out.reserve(size());
        for_each([&](const K& k, const V&) { out.push_back(k); });
        return out;
    }

    std::vector<V> values() const {
        std::vector<V> out;
        out.reserve(size());
        for_each([&](const K&, const V& v) { out.push_back(v); });
        return out;
    }

    /**
     * @brief Keys whose bindings differ between this map (left) and `other` (right)
     * @param value_equal Decides whether two values of a shared key are the same
     * @return Differences in ascending key order
     * @throws IncompatibleComparator if the maps were built with different comparators
     *
     * Walks both trees in order side by side. Whenever the two walks meet the same key
     * and that key's right subtree is the same node on both sides, the subtree is
     * skipped without being visited: maps derived from one another by k edits are
     * compared in roughly O(k log n) rather than O(n).
     */
    template<typename Eq = std::equal_to<V>>
    std::vector<diff_entry> symmetric_diff(const PersistentMap& other, Eq value_equal = {}) const {
        require_same_identity("symmetric_diff", comparator_, other.comparator_);
        std::vector<diff_entry> out;
        if (root_ == other.root_) {
            return out;
        }

        std::vector<const node_t*> left;
        std::vector<const node_t*> right;
        tree_t::push_left_spine(left, root_.get());
        tree_t::push_left_spine(right, other.root_.get());

        while (!left.empty() && !right.empty()) {
            const node_t* a{left.back()};
            const node_t* b{right.back()};
            const auto c{comparator_.compare(a->key, b->key)};
            if (c < 0) {
                out.push_back({a->key, DiffLeft<V>{a->value}});
                left.pop_back();
                tree_t::push_left_spine(left, a->right.get());
            } else if (c > 0) {
                out.push_back({b->key, DiffRight<V>{b->value}});
                right.pop_back();
                tree_t::push_left_spine(right, b->right.get());
            } else {
                left.pop_back();
                right.pop_back();
                if (a != b && !value_equal(a->value, b->value)) {
                    out.push_back({a->key, DiffUnequal<V>{a->value, b->value}});
                }
                if (a->right != b->right) {
                    tree_t::push_left_spine(left, a->right.get());
                    tree_t::push_left_spine(right, b->right.get());
                }
            }
        }
        while (!left.empty()) {
            const node_t* a{left.back()};
            left.pop_back();
            out.push_back({a->key, DiffLeft<V>{a->value}});
            tree_t::push_left_spine(left, a->right.get());
        }
        while (!right.empty()) {
            const node_t* b{right.back()};
            right.pop_back();
            out.push_back({b->key, DiffRight<V>{b->value}});
            tree_t::push_left_spine(right, b->right.get());
        }
        return out;
    }

    /**
     * @brief Logical equality: same keys in the same order, bound to equal values
     *
     * Two maps holding the same bindings compare equal whatever shape their trees have.
     * @throws IncompatibleComparator if the maps were built with different comparators
     */
    bool operator==(const PersistentMap& other) const {
        require_same_identity("operator==", comparator_, other.comparator_);
        if (root_ == other.root_) return true;
        if (size() != other.size()) return false;
        auto it{other.begin()};
        for (const auto& [key, value] : *this) {
            const auto [other_key, other_value] {*it};
            if (!comparator_.equivalent(key, other_key) || !(value == other_value)) {
                return false;
            }
            ++it;
        }
        return true;
    }

    /**
     * @brief True when both maps are the very same tree, not merely equal ones
     */
    bool physically_equal(const PersistentMap& other) const noexcept {
        return root_ == other.root_;
    }

    const Comparator<K>& comparator() const noexcept {
        return comparator_;
    }

    MemoryStats get_memory_stats() const {
        return MemoryStats{
            .total_nodes = size(),
            .max_depth = tree_t::height(root_),
        };
    }

    Iterator begin() const {
        return Iterator{root_.get()};
    }

    Iterator end() const {
        return Iterator{};
    }
};

#endif // PERSISTENTMAP_HPP
