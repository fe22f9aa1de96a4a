#ifndef BUCKET_TREE_HPP
#define BUCKET_TREE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "Hasher.hpp"
#include "allocator/tracking_allocator.hpp"

/* BucketNode:
 * One entry of a hashtable bucket. Buckets are small mutable AVL trees ordered by the hasher's
 * bucket order, so a bucket overloaded by colliding hashes still answers in O(log n).
 *
 * Nodes are owned by the bucket root and allocated through a `tracking_allocator` built around
 * the owning table's byte counter. A bucket must be released with `BucketTree::destroy(root, alloc)`,
 * and copied with `BucketTree::clone(root, alloc)`.
 */
template<typename K, typename V>
struct BucketNode {
    std::pair<const K, V> entry;
    BucketNode* left{};
    BucketNode* right{};
    std::uint32_t height{1};

    BucketNode(const K& key, V value)
        : entry{key, std::move(value)} {}
};

template<typename K, typename V>
struct BucketTree {
    using node_t = BucketNode<K, V>;
    using allocator_t = tracking_allocator<node_t>;
    using hasher_t = Hasher<K>;

    static constexpr std::uint32_t height(const node_t* t) noexcept {
        return t != nullptr ? t->height : 0;
    }

    static node_t* create(std::size_t& alloc, const K& key, V value) {
        allocator_t a{alloc};
        node_t* n{a.allocate(1)};
        try {
            a.construct(n, key, std::move(value));
        } catch (...) {
            a.deallocate(n, 1);
            throw;
        }
        return n;
    }

    static void release(node_t* n, std::size_t& alloc) noexcept {
        allocator_t a{alloc};
        a.destroy(n);
        a.deallocate(n, 1);
    }

    static void destroy(node_t* t, std::size_t& alloc) noexcept {
        if (t == nullptr) return;
        destroy(t->left, alloc);
        destroy(t->right, alloc);
        release(t, alloc);
    }

    static node_t* clone(const node_t* t, std::size_t& alloc) {
        if (t == nullptr) return nullptr;
        node_t* n{create(alloc, t->entry.first, t->entry.second)};
        n->height = t->height;
        try {
            n->left = clone(t->left, alloc);
            n->right = clone(t->right, alloc);
        } catch (...) {
            destroy(n, alloc);
            throw;
        }
        return n;
    }

    static node_t* find(node_t* t, const K& key, const hasher_t& hasher) {
        while (t != nullptr) {
            if (hasher.equal(key, t->entry.first)) {
                return t;
            }
            t = hasher.bucket_order().less(key, t->entry.first) ? t->left : t->right;
        }
        return nullptr;
    }

    static node_t* rotate_left(node_t* t) noexcept {
        node_t* r{t->right};
        t->right = r->left;
        r->left = t;
        update(t);
        update(r);
        return r;
    }

    static node_t* rotate_right(node_t* t) noexcept {
        node_t* l{t->left};
        t->left = l->right;
        l->right = t;
        update(t);
        update(l);
        return l;
    }

    static void update(node_t* t) noexcept {
        t->height = 1 + std::max(height(t->left), height(t->right));
    }

    // Restores the AVL invariant at `t` after one of its subtrees changed height by one.
    static node_t* fix(node_t* t) noexcept {
        update(t);
        const auto hl{height(t->left)};
        const auto hr{height(t->right)};
        if (hl == hr + 2) {
            if (height(t->left->left) < height(t->left->right)) {
                t->left = rotate_left(t->left);
            }
            return rotate_right(t);
        }
        if (hr == hl + 2) {
            if (height(t->right->right) < height(t->right->left)) {
                t->right = rotate_right(t->right);
            }
            return rotate_left(t);
        }
        return t;
    }

    // Links a detached node whose key is not yet in the bucket.
    static node_t* insert(node_t* t, node_t* n, const hasher_t& hasher) {
        if (t == nullptr) {
            return n;
        }
        if (hasher.bucket_order().less(n->entry.first, t->entry.first)) {
            t->left = insert(t->left, n, hasher);
        } else {
            t->right = insert(t->right, n, hasher);
        }
        return fix(t);
    }

    static node_t* detach_min(node_t* t, node_t*& min) noexcept {
        if (t->left == nullptr) {
            min = t;
            return t->right;
        }
        t->left = detach_min(t->left, min);
        return fix(t);
    }

    // Unlinks the node holding `key` into `removed`, which the caller then owns.
    static node_t* erase(node_t* t, const K& key, const hasher_t& hasher, node_t*& removed) {
        if (t == nullptr) {
            return nullptr;
        }
        if (hasher.equal(key, t->entry.first)) {
            removed = t;
            node_t* l{std::exchange(t->left, nullptr)};
            node_t* r{std::exchange(t->right, nullptr)};
            if (l == nullptr) return r;
            if (r == nullptr) return l;
            node_t* m{nullptr};
            r = detach_min(r, m);
            m->left = l;
            m->right = r;
            return fix(m);
        }
        if (hasher.bucket_order().less(key, t->entry.first)) {
            t->left = erase(t->left, key, hasher, removed);
        } else {
            t->right = erase(t->right, key, hasher, removed);
        }
        return fix(t);
    }

    // Unlinks every node of the bucket and hands each one, reset to a leaf, to `sink`.
    template<typename Sink>
    static void drain(node_t* t, Sink& sink) {
        if (t == nullptr) return;
        node_t* l{std::exchange(t->left, nullptr)};
        node_t* r{std::exchange(t->right, nullptr)};
        t->height = 1;
        drain(l, sink);
        drain(r, sink);
        sink(t);
    }

    template<typename F>
    static void in_order(node_t* t, F& f) {
        if (t == nullptr) return;
        in_order(t->left, f);
        f(t->entry);
        in_order(t->right, f);
    }

    static void push_left_spine(std::vector<const node_t*>& stack, const node_t* n) {
        while (n != nullptr) {
            stack.push_back(n);
            n = n->left;
        }
    }
};

#endif // BUCKET_TREE_HPP
