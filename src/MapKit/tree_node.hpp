#ifndef TREE_NODE_HPP
#define TREE_NODE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "Comparator.hpp"

/* TreeNode:
 * One binding of a persistent AVL tree. Nodes are immutable once built and are owned through
 * `std::shared_ptr<const TreeNode>`, so any number of map versions may point at the same subtree.
 * An update copies only the nodes on the path from the root to the changed binding; every other
 * subtree of the new version is the very same object as in the old one.
 *
 *   key, value : the binding
 *   left, right: subtrees, all keys of `left` < key < all keys of `right`
 *   height     : 1 + max(height(left), height(right)); |height(left) - height(right)| <= 2 after rebalancing
 *   count      : number of bindings in this subtree, makes `size()` O(1)
 */
template<typename K, typename V>
struct TreeNode {
    using ptr_t = std::shared_ptr<const TreeNode>;

    K key;
    V value;
    ptr_t left;
    ptr_t right;
    std::uint32_t height;
    std::size_t count;
};

/* Tree:
 * Stateless algorithms over `TreeNode` roots. Every function returns a new root and leaves its
 * arguments untouched; when nothing changes the argument root itself is returned, which keeps
 * physical equality meaningful for the diff and set algebra shortcuts.
 */
template<typename K, typename V>
struct Tree {
    using node_t = TreeNode<K, V>;
    using ptr_t = typename node_t::ptr_t;
    using comparator_t = Comparator<K>;

    struct split_t {
        ptr_t left;
        ptr_t match;
        ptr_t right;
    };

    static constexpr std::uint32_t height(const ptr_t& t) noexcept {
        return t ? t->height : 0;
    }

    static constexpr std::size_t count(const ptr_t& t) noexcept {
        return t ? t->count : 0;
    }

    static ptr_t make(ptr_t l, K key, V value, ptr_t r) {
        const auto h{1 + std::max(height(l), height(r))};
        const auto n{1 + count(l) + count(r)};
        return std::make_shared<const node_t>(
            node_t{std::move(key), std::move(value), std::move(l), std::move(r), h, n});
    }

    static ptr_t leaf(K key, V value) {
        return make(nullptr, std::move(key), std::move(value), nullptr);
    }

    // Rebuilds (l, key, r) with at most a double rotation. Heights of l and r may differ by up to 3.
    static ptr_t balance(ptr_t l, K key, V value, ptr_t r) {
        const auto hl{height(l)};
        const auto hr{height(r)};
        if (hl > hr + 1) {
            if (height(l->left) >= height(l->right)) {
                return make(l->left, l->key, l->value,
                            make(l->right, std::move(key), std::move(value), std::move(r)));
            }
            const auto& lr{l->right};
            return make(make(l->left, l->key, l->value, lr->left), lr->key, lr->value,
                        make(lr->right, std::move(key), std::move(value), std::move(r)));
        }
        if (hr > hl + 1) {
            if (height(r->right) >= height(r->left)) {
                return make(make(std::move(l), std::move(key), std::move(value), r->left),
                            r->key, r->value, r->right);
            }
            const auto& rl{r->left};
            return make(make(std::move(l), std::move(key), std::move(value), rl->left),
                        rl->key, rl->value, make(rl->right, r->key, r->value, r->right));
        }
        return make(std::move(l), std::move(key), std::move(value), std::move(r));
    }

    static const node_t* find(const ptr_t& t, const K& key, const comparator_t& cmp) {
        const node_t* n{t.get()};
        while (n != nullptr) {
            const auto c{cmp.compare(key, n->key)};
            if (c == 0) {
                return n;
            }
            n = c < 0 ? n->left.get() : n->right.get();
        }
        return nullptr;
    }

    static ptr_t insert(const ptr_t& t, const K& key, const V& value, const comparator_t& cmp) {
        if (!t) {
            return leaf(key, value);
        }
        const auto c{cmp.compare(key, t->key)};
        if (c < 0) {
            return balance(insert(t->left, key, value, cmp), t->key, t->value, t->right);
        }
        if (c > 0) {
            return balance(t->left, t->key, t->value, insert(t->right, key, value, cmp));
        }
        return make(t->left, key, value, t->right);
    }

    static const node_t* min_node(const ptr_t& t) noexcept {
        const node_t* n{t.get()};
        if (n == nullptr) return nullptr;
        while (n->left) n = n->left.get();
        return n;
    }

    static const node_t* max_node(const ptr_t& t) noexcept {
        const node_t* n{t.get()};
        if (n == nullptr) return nullptr;
        while (n->right) n = n->right.get();
        return n;
    }

    // Smallest binding with key strictly greater than `key`.
    static const node_t* successor(const ptr_t& t, const K& key, const comparator_t& cmp) {
        const node_t* best{nullptr};
        const node_t* n{t.get()};
        while (n != nullptr) {
            if (cmp.less(key, n->key)) {
                best = n;
                n = n->left.get();
            } else {
                n = n->right.get();
            }
        }
        return best;
    }

    // Largest binding with key strictly smaller than `key`.
    static const node_t* predecessor(const ptr_t& t, const K& key, const comparator_t& cmp) {
        const node_t* best{nullptr};
        const node_t* n{t.get()};
        while (n != nullptr) {
            if (cmp.less(n->key, key)) {
                best = n;
                n = n->right.get();
            } else {
                n = n->left.get();
            }
        }
        return best;
    }

    static ptr_t remove_min(const ptr_t& t) {
        if (!t->left) {
            return t->right;
        }
        return balance(remove_min(t->left), t->key, t->value, t->right);
    }

    // Glues two trees whose heights differ by at most 2 and whose keys are ordered l < r.
    static ptr_t merge(const ptr_t& l, const ptr_t& r) {
        if (!l) return r;
        if (!r) return l;
        const auto* m{min_node(r)};
        return balance(l, m->key, m->value, remove_min(r));
    }

    static ptr_t remove(const ptr_t& t, const K& key, const comparator_t& cmp) {
        if (!t) {
            return t;
        }
        const auto c{cmp.compare(key, t->key)};
        if (c < 0) {
            auto l{remove(t->left, key, cmp)};
            if (l == t->left) return t;
            return balance(std::move(l), t->key, t->value, t->right);
        }
        if (c > 0) {
            auto r{remove(t->right, key, cmp)};
            if (r == t->right) return t;
            return balance(t->left, t->key, t->value, std::move(r));
        }
        return merge(t->left, t->right);
    }

    static ptr_t add_min(const K& key, const V& value, const ptr_t& t) {
        if (!t) return leaf(key, value);
        return balance(add_min(key, value, t->left), t->key, t->value, t->right);
    }

    static ptr_t add_max(const K& key, const V& value, const ptr_t& t) {
        if (!t) return leaf(key, value);
        return balance(t->left, t->key, t->value, add_max(key, value, t->right));
    }

    // Like `make`, but l and r may have arbitrary heights.
    static ptr_t join(const ptr_t& l, const K& key, const V& value, const ptr_t& r) {
        if (!l) return add_min(key, value, r);
        if (!r) return add_max(key, value, l);
        if (l->height > r->height + 2) {
            return balance(l->left, l->key, l->value, join(l->right, key, value, r));
        }
        if (r->height > l->height + 2) {
            return balance(join(l, key, value, r->left), r->key, r->value, r->right);
        }
        return make(l, key, value, r);
    }

    // Like `merge`, but l and r may have arbitrary heights.
    static ptr_t concat(const ptr_t& l, const ptr_t& r) {
        if (!l) return r;
        if (!r) return l;
        const auto* m{min_node(r)};
        return join(l, m->key, m->value, remove_min(r));
    }

    static split_t split(const ptr_t& t, const K& key, const comparator_t& cmp) {
        if (!t) {
            return {};
        }
        const auto c{cmp.compare(key, t->key)};
        if (c == 0) {
            return {t->left, t, t->right};
        }
        if (c < 0) {
            auto s{split(t->left, key, cmp)};
            return {std::move(s.left), std::move(s.match), join(s.right, t->key, t->value, t->right)};
        }
        auto s{split(t->right, key, cmp)};
        return {join(t->left, t->key, t->value, s.left), std::move(s.match), std::move(s.right)};
    }

    // Union; on a shared key the binding of `a` wins when `prefer_a`, otherwise the one of `b`.
    static ptr_t unite(const ptr_t& a, const ptr_t& b, const comparator_t& cmp, bool prefer_a) {
        if (a == b || !b) return a;
        if (!a) return b;
        auto s{split(b, a->key, cmp)};
        auto l{unite(a->left, s.left, cmp, prefer_a)};
        auto r{unite(a->right, s.right, cmp, prefer_a)};
        if (!prefer_a && s.match) {
            return join(l, s.match->key, s.match->value, r);
        }
        if (l == a->left && r == a->right) return a;
        return join(l, a->key, a->value, r);
    }

    static ptr_t intersect(const ptr_t& a, const ptr_t& b, const comparator_t& cmp) {
        if (!a || !b) return nullptr;
        if (a == b) return a;
        auto s{split(b, a->key, cmp)};
        auto l{intersect(a->left, s.left, cmp)};
        auto r{intersect(a->right, s.right, cmp)};
        if (!s.match) {
            return concat(l, r);
        }
        if (l == a->left && r == a->right) return a;
        return join(l, a->key, a->value, r);
    }

    static ptr_t difference(const ptr_t& a, const ptr_t& b, const comparator_t& cmp) {
        if (!a || a == b) return nullptr;
        if (!b) return a;
        auto s{split(b, a->key, cmp)};
        auto l{difference(a->left, s.left, cmp)};
        auto r{difference(a->right, s.right, cmp)};
        if (s.match) {
            return concat(l, r);
        }
        if (l == a->left && r == a->right) return a;
        return join(l, a->key, a->value, r);
    }

    static bool is_subset(const ptr_t& a, const ptr_t& b, const comparator_t& cmp) {
        if (!a || a == b) return true;
        if (!b || a->count > b->count) return false;
        auto s{split(b, a->key, cmp)};
        return s.match && is_subset(a->left, s.left, cmp) && is_subset(a->right, s.right, cmp);
    }

    template<typename Pred>
    static ptr_t filter(const ptr_t& t, Pred& pred) {
        if (!t) return t;
        auto l{filter(t->left, pred)};
        const bool keep{pred(t->key, t->value)};
        auto r{filter(t->right, pred)};
        if (!keep) {
            return concat(l, r);
        }
        if (l == t->left && r == t->right) return t;
        return join(l, t->key, t->value, r);
    }

    // Pushes `n` and its chain of left children; the top of the stack is the next binding in order.
    static void push_left_spine(std::vector<const node_t*>& stack, const node_t* n) {
        while (n != nullptr) {
            stack.push_back(n);
            n = n->left.get();
        }
    }

    template<typename F>
    static void in_order(const ptr_t& t, F& f) {
        std::vector<const node_t*> stack;
        push_left_spine(stack, t.get());
        while (!stack.empty()) {
            const node_t* n{stack.back()};
            stack.pop_back();
            f(*n);
            push_left_spine(stack, n->right.get());
        }
    }
};

#endif // TREE_NODE_HPP
