#include "doctest.h"

#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <random>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "MapKit/HashSet.hpp"
#include "MapKit/HashTable.hpp"
#include "MapKit/PersistentMap.hpp"

TEST_SUITE("MapKit Fuzz Tests") {
    TEST_CASE("fuzz persistent map against std::map") {
        std::mt19937 rng(12345);
        std::uniform_int_distribution<int> dist(0, 5000);
        std::uniform_int_distribution<int> op(0, 9);

        PersistentMap<int, int> map;
        std::map<int, int> reference;

        for (int i = 0; i < 5000; ++i) {
            const int key = dist(rng);
            const int choice = op(rng);
            if (choice < 6) {
                map = map.insert(key, i);
                reference[key] = i;
            } else if (choice < 9) {
                map = map.remove(key);
                reference.erase(key);
            } else {
                map = map.change(key, [](std::optional<int> v) -> std::optional<int> {
                    if (v.has_value() && *v % 2 == 0) return std::nullopt;
                    return v.value_or(0) + 1;
                });
                auto it = reference.find(key);
                if (it == reference.end()) {
                    reference[key] = 1;
                } else if (it->second % 2 == 0) {
                    reference.erase(it);
                } else {
                    it->second += 1;
                }
            }
        }

        REQUIRE(map.size() == reference.size());
        auto it = reference.begin();
        for (const auto& [k, v] : map) {
            REQUIRE(k == it->first);
            REQUIRE(v == it->second);
            ++it;
        }
    }

    TEST_CASE("fuzz successor/predecessor correctness") {
        std::mt19937 rng(34567);
        std::uniform_int_distribution<int> dist(0, 10000);

        PersistentMap<int, int> map;
        std::map<int, int> reference;
        for (int i = 0; i < 500; ++i) {
            const int key = dist(rng);
            map = map.insert(key, key);
            reference[key] = key;
        }

        for (int probe = -1; probe <= 10001; probe += 7) {
            const auto succ = map.successor(probe);
            const auto up = reference.upper_bound(probe);
            REQUIRE(succ.has_value() == (up != reference.end()));
            if (succ.has_value()) {
                REQUIRE(succ->first == up->first);
            }

            const auto pred = map.predecessor(probe);
            const auto low = reference.lower_bound(probe);
            REQUIRE(pred.has_value() == (low != reference.begin()));
            if (pred.has_value()) {
                REQUIRE(pred->first == std::prev(low)->first);
            }
        }
    }

    TEST_CASE("fuzz diff between random versions") {
        std::mt19937 rng(56789);
        std::uniform_int_distribution<int> dist(0, 2000);

        PersistentMap<int, int> base;
        for (int i = 0; i < 1000; ++i) {
            base = base.insert(dist(rng), i);
        }
        auto edited = base;
        for (int i = 0; i < 50; ++i) {
            const int key = dist(rng);
            edited = (i % 3 == 0) ? edited.remove(key) : edited.insert(key, -i);
        }

        std::size_t expected = 0;
        for (int key = 0; key <= 2000; ++key) {
            const auto a = base.find(key);
            const auto b = edited.find(key);
            if (a != b) ++expected;
        }
        REQUIRE(base.symmetric_diff(edited).size() == expected);
        REQUIRE(edited.symmetric_diff(base).size() == expected);
    }

    TEST_CASE("fuzz hashtable against std::unordered_map") {
        std::mt19937 rng(23456);
        std::uniform_int_distribution<int> dist(0, 50000);
        std::bernoulli_distribution insert_or_remove(0.7);

        HashTable<int, int> table{Hasher<int>::standard(), 1};
        std::unordered_map<int, int> reference;

        for (int i = 0; i < 20000; ++i) {
            const int key = dist(rng);
            if (insert_or_remove(rng)) {
                table.set(key, i);
                reference[key] = i;
            } else {
                REQUIRE(table.remove(key) == (reference.erase(key) == 1));
            }
        }

        REQUIRE(table.size() == reference.size());
        for (const auto& [k, v] : reference) {
            REQUIRE(table.find(k) == std::optional<int>{v});
        }
        std::size_t visited = 0;
        for (const auto& entry : table) {
            REQUIRE(reference.count(entry.first) == 1);
            ++visited;
        }
        REQUIRE(visited == reference.size());
    }

    TEST_CASE("fuzz hashtable with a weak hash") {
        auto weak = make_hasher<int>([](const int& k) { return static_cast<std::size_t>(k % 13); },
                                     [](const int& a, const int& b) { return a == b; });
        std::mt19937 rng(45678);
        std::uniform_int_distribution<int> dist(0, 3000);

        HashTable<int, int> table{weak};
        std::unordered_map<int, int> reference;
        for (int i = 0; i < 5000; ++i) {
            const int key = dist(rng);
            if (i % 4 == 3) {
                table.remove(key);
                reference.erase(key);
            } else {
                table.set(key, i);
                reference[key] = i;
            }
        }
        REQUIRE(table.size() == reference.size());
        REQUIRE(table.get_memory_stats().used_buckets <= 13);
        for (const auto& [k, v] : reference) {
            REQUIRE(table.find(k) == std::optional<int>{v});
        }
    }

    TEST_CASE("fuzz hash set algebra against std::unordered_set") {
        std::mt19937 rng(67890);
        std::uniform_int_distribution<int> dist(0, 500);

        HashSet<int> a;
        HashSet<int> b;
        std::unordered_set<int> ra;
        std::unordered_set<int> rb;
        for (int i = 0; i < 300; ++i) {
            const int x = dist(rng);
            const int y = dist(rng);
            a.add(x);
            ra.insert(x);
            b.add(y);
            rb.insert(y);
        }

        const auto inter = a & b;
        std::size_t expected_inter = 0;
        for (int x : ra) {
            if (rb.count(x) != 0) ++expected_inter;
        }
        REQUIRE(inter.size() == expected_inter);
        REQUIRE((a | b).size() == ra.size() + rb.size() - expected_inter);
        REQUIRE((a - b).size() == ra.size() - expected_inter);
        REQUIRE((a ^ b).size() == ra.size() + rb.size() - 2 * expected_inter);
    }
}
