#ifndef ORDEREDSET_HPP
#define ORDEREDSET_HPP

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <utility>
#include <vector>

#include "Comparator.hpp"
#include "MapKitCommon.hpp"
#include "tree_node.hpp"

/**
 * @brief Persistent ordered set: the map tree with a unit value
 *
 * Updates return new sets that share structure with the receiver. Set algebra splits
 * and joins trees, so combining a large set with a small one costs roughly
 * O(m log(n / m + 1)), and subtrees that are the same object on both sides are taken
 * or dropped whole.
 */
template<typename K>
class OrderedSet {
    using tree_t = Tree<K, Unit>;
    using node_t = typename tree_t::node_t;
    using ptr_t = typename tree_t::ptr_t;

    Comparator<K> comparator_;
    ptr_t root_;

    OrderedSet(Comparator<K> comparator, ptr_t root)
        : comparator_{std::move(comparator)}, root_{std::move(root)} {}

    OrderedSet with_root(ptr_t root) const {
        return OrderedSet{comparator_, std::move(root)};
    }

    static std::optional<K> element(const node_t* n) {
        if (n == nullptr) {
            return std::nullopt;
        }
        return n->key;
    }

public:
    using key_type = K;
    using value_type = K;
    using size_type = std::size_t;

    class Iterator {
        std::vector<const node_t*> stack_;

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = K;
        using difference_type = std::ptrdiff_t;
        using pointer = const K*;
        using reference = const K&;

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
            return stack_.back()->key;
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

    explicit OrderedSet(Comparator<K> comparator = Comparator<K>::standard())
        : comparator_{std::move(comparator)} {}

    OrderedSet(std::initializer_list<K> elements, Comparator<K> comparator = Comparator<K>::standard())
        : comparator_{std::move(comparator)} {
        for (const auto& e : elements) {
            root_ = tree_t::insert(root_, e, Unit{}, comparator_);
        }
    }

    template<std::ranges::input_range R>
    static OrderedSet from_range(Comparator<K> comparator, R&& elements) {
        ptr_t root;
        for (const auto& e : elements) {
            root = tree_t::insert(root, e, Unit{}, comparator);
        }
        return OrderedSet{std::move(comparator), std::move(root)};
    }

    bool contains(const K& key) const {
        return tree_t::find(root_, key, comparator_) != nullptr;
    }

    [[nodiscard]] OrderedSet add(const K& key) const {
        if (contains(key)) {
            return *this;
        }
        return with_root(tree_t::insert(root_, key, Unit{}, comparator_));
    }

    [[nodiscard]] OrderedSet remove(const K& key) const {
        return with_root(tree_t::remove(root_, key, comparator_));
    }

    std::size_t size() const noexcept {
        return tree_t::count(root_);
    }

    bool empty() const noexcept {
        return !root_;
    }

    std::optional<K> min() const {
        return element(tree_t::min_node(root_));
    }

    std::optional<K> max() const {
        return element(tree_t::max_node(root_));
    }

    std::optional<K> successor(const K& key) const {
        return element(tree_t::successor(root_, key, comparator_));
    }

    std::optional<K> predecessor(const K& key) const {
        return element(tree_t::predecessor(root_, key, comparator_));
    }

    std::vector<K> to_ordered_sequence() const {
        return std::vector<K>(begin(), end());
    }

    /**
     * @throws IncompatibleComparator if the sets were built with different comparators
     */
    [[nodiscard]] OrderedSet set_union(const OrderedSet& other) const {
        require_same_identity("set_union", comparator_, other.comparator_);
        return with_root(tree_t::unite(root_, other.root_, comparator_, true));
    }

    [[nodiscard]] OrderedSet set_intersection(const OrderedSet& other) const {
        require_same_identity("set_intersection", comparator_, other.comparator_);
        return with_root(tree_t::intersect(root_, other.root_, comparator_));
    }

    [[nodiscard]] OrderedSet set_difference(const OrderedSet& other) const {
        require_same_identity("set_difference", comparator_, other.comparator_);
        return with_root(tree_t::difference(root_, other.root_, comparator_));
    }

    [[nodiscard]] OrderedSet symmetric_difference(const OrderedSet& other) const {
        require_same_identity("symmetric_difference", comparator_, other.comparator_);
        return with_root(tree_t::unite(tree_t::difference(root_, other.root_, comparator_),
                                       tree_t::difference(other.root_, root_, comparator_),
                                       comparator_, true));
    }

    bool is_subset(const OrderedSet& other) const {
        require_same_identity("is_subset", comparator_, other.comparator_);
        return tree_t::is_subset(root_, other.root_, comparator_);
    }

    OrderedSet operator|(const OrderedSet& other) const { return set_union(other); }
    OrderedSet operator&(const OrderedSet& other) const { return set_intersection(other); }
    OrderedSet operator-(const OrderedSet& other) const { return set_difference(other); }
    OrderedSet operator^(const OrderedSet& other) const { return symmetric_difference(other); }

    /**
     * @brief Equality of contents, independent of tree shape
     */
    bool operator==(const OrderedSet& other) const {
        require_same_identity("operator==", comparator_, other.comparator_);
        if (root_ == other.root_) return true;
        if (size() != other.size()) return false;
        auto it{other.begin()};
        for (const auto& key : *this) {
            if (!comparator_.equivalent(key, *it)) {
                return false;
            }
            ++it;
        }
        return true;
    }

    /**
     * @brief True when both sets are the very same tree
     */
    bool physically_equal(const OrderedSet& other) const noexcept {
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

#endif // ORDEREDSET_HPP
