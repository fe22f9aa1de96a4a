#ifndef HASHSET_HPP
#define HASHSET_HPP

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <ranges>
#include <utility>
#include <vector>

#include "HashTable.hpp"
#include "Hasher.hpp"
#include "MapKitCommon.hpp"

/**
 * @brief Mutable hash set: a HashTable with a unit value
 *
 * Set algebra requires both operands to carry the same hasher identity and throws
 * IncompatibleComparator otherwise, before touching either set.
 */
template<typename K>
class HashSet {
    using table_t = HashTable<K, Unit>;

    table_t table_;

    explicit HashSet(table_t&& table) noexcept
        : table_{std::move(table)} {}

public:
    using key_type = K;
    using value_type = K;
    using size_type = std::size_t;

    class Iterator {
        typename table_t::Iterator it_;

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = K;
        using difference_type = std::ptrdiff_t;
        using pointer = const K*;
        using reference = const K&;

        Iterator() = default;

        explicit Iterator(typename table_t::Iterator it) : it_{std::move(it)} {}

        Iterator& operator++() {
            ++it_;
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp{*this};
            ++*this;
            return tmp;
        }

        reference operator*() const {
            return it_->first;
        }

        bool operator==(const Iterator& other) const {
            return it_ == other.it_;
        }
    };

    using iterator = Iterator;
    using const_iterator = Iterator;

    explicit HashSet(Hasher<K> hasher = Hasher<K>::standard(), HashTableOptions options = {})
        : table_{std::move(hasher), options} {}

    HashSet(std::initializer_list<K> elements, Hasher<K> hasher = Hasher<K>::standard())
        : table_{std::move(hasher), HashTableOptions{.initial_size = elements.size()}} {
        for (const auto& e : elements) {
            table_.set(e, Unit{});
        }
    }

    HashSet(const HashSet&) = delete;
    HashSet& operator=(const HashSet&) = delete;
    HashSet(HashSet&&) noexcept = default;
    HashSet& operator=(HashSet&&) noexcept = default;

    [[nodiscard]] HashSet copy() const {
        return HashSet{table_.copy()};
    }

    /**
     * @return true if `key` was not already present
     */
    bool add(const K& key) {
        return table_.add(key, Unit{});
    }

    /**
     * @return true if `key` was present
     */
    bool remove(const K& key) {
        return table_.remove(key);
    }

    bool contains(const K& key) const {
        return table_.contains(key);
    }

    std::size_t size() const noexcept {
        return table_.size();
    }

    bool empty() const noexcept {
        return table_.empty();
    }

    void clear() noexcept {
        table_.clear();
    }

    /**
     * @brief Elements in unspecified order
     */
    std::vector<K> elements() const {
        return table_.keys();
    }

    HashSet& operator|=(const HashSet& other) {
        require_same_identity("operator|=", hasher(), other.hasher());
        for (const auto& key : other) {
            add(key);
        }
        return *this;
    }

    HashSet& operator&=(const HashSet& other) {
        require_same_identity("operator&=", hasher(), other.hasher());
        std::vector<K> doomed;
        for (const auto& key : *this) {
            if (!other.contains(key)) {
                doomed.push_back(key);
            }
        }
        for (const auto& key : doomed) {
            remove(key);
        }
        return *this;
    }

    HashSet& operator-=(const HashSet& other) {
        require_same_identity("operator-=", hasher(), other.hasher());
        if (this == &other) {
            clear();
            return *this;
        }
        for (const auto& key : other) {
            remove(key);
        }
        return *this;
    }

    HashSet& operator^=(const HashSet& other) {
        require_same_identity("operator^=", hasher(), other.hasher());
        if (this == &other) {
            clear();
            return *this;
        }
        for (const auto& key : other) {
            if (!remove(key)) {
                add(key);
            }
        }
        return *this;
    }

    HashSet set_union(const HashSet& other) const {
        HashSet result{copy()};
        result |= other;
        return result;
    }

    HashSet set_intersection(const HashSet& other) const {
        require_same_identity("set_intersection", hasher(), other.hasher());
        HashSet result{hasher()};
        for (const auto& key : *this) {
            if (other.contains(key)) {
                result.add(key);
            }
        }
        return result;
    }

    HashSet set_difference(const HashSet& other) const {
        require_same_identity("set_difference", hasher(), other.hasher());
        HashSet result{hasher()};
        for (const auto& key : *this) {
            if (!other.contains(key)) {
                result.add(key);
            }
        }
        return result;
    }

    HashSet symmetric_difference(const HashSet& other) const {
        HashSet result{copy()};
        result ^= other;
        return result;
    }

    HashSet operator|(const HashSet& other) const { return set_union(other); }
    HashSet operator&(const HashSet& other) const { return set_intersection(other); }
    HashSet operator-(const HashSet& other) const { return set_difference(other); }
    HashSet operator^(const HashSet& other) const { return symmetric_difference(other); }

    bool is_subset(const HashSet& other) const {
        require_same_identity("is_subset", hasher(), other.hasher());
        if (size() > other.size()) return false;
        for (const auto& key : *this) {
            if (!other.contains(key)) return false;
        }
        return true;
    }

    /**
     * @brief Equality of contents, independent of bucket layout and insertion order
     */
    bool operator==(const HashSet& other) const {
        require_same_identity("operator==", hasher(), other.hasher());
        return size() == other.size() && is_subset(other);
    }

    const Hasher<K>& hasher() const noexcept {
        return table_.hasher();
    }

    constexpr std::size_t get_allocated_bytes() const noexcept {
        return table_.get_allocated_bytes();
    }

    MemoryStats get_memory_stats() const {
        return table_.get_memory_stats();
    }

    Iterator begin() const {
        return Iterator{table_.begin()};
    }

    Iterator end() const {
        return Iterator{table_.end()};
    }
};

#endif // HASHSET_HPP
