#include "benchmark.hpp"
#include "MapKit/HashSet.hpp"
#include "MapKit/HashTable.hpp"
#include "MapKit/OrderedSet.hpp"
#include "MapKit/PersistentMap.hpp"
#include <nanobench.h>
#include <fmt/format.h>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

extern std::ofstream g_output;

using Map = PersistentMap<std::int64_t, std::int64_t>;
using Table = HashTable<std::int64_t, std::int64_t>;

namespace {

const std::vector<std::uint32_t> SIZES = {1000, 10000, 100000};

Map build_map(const std::vector<std::int64_t>& keys) {
    Map map;
    for (std::int64_t key : keys) {
        map = map.insert(key, key);
    }
    return map;
}

Table build_table(const std::vector<std::int64_t>& keys) {
    Table table;
    for (std::int64_t key : keys) {
        table.set(key, key);
    }
    return table;
}

} // namespace

void bench_macro_insert() {
    for (std::uint32_t size : SIZES) {
        const auto keys = generate_random_keys(size, size * 4);
        const auto suffix = std::to_string(size);

        auto map_bench = run_macro_benchmark(
            "persistent_map_insert_" + suffix, "PersistentMap", "insert_random", size,
            [&] {
                auto map = build_map(keys);
                ankerl::nanobench::doNotOptimizeAway(&map);
            });
        ankerl::nanobench::render(benchmark_json_template(), map_bench, g_output);

        auto table_bench = run_macro_benchmark(
            "hashtable_insert_" + suffix, "HashTable", "insert_random", size,
            [&] {
                auto table = build_table(keys);
                ankerl::nanobench::doNotOptimizeAway(&table);
            });
        ankerl::nanobench::render(benchmark_json_template(), table_bench, g_output);

        auto std_map_bench = run_macro_benchmark(
            "std_map_insert_" + suffix, "std::map", "insert_random", size,
            [&] {
                std::map<std::int64_t, std::int64_t> map;
                for (std::int64_t key : keys) {
                    map[key] = key;
                }
                ankerl::nanobench::doNotOptimizeAway(&map);
            });
        ankerl::nanobench::render(benchmark_json_template(), std_map_bench, g_output);

        auto std_table_bench = run_macro_benchmark(
            "std_unordered_map_insert_" + suffix, "std::unordered_map", "insert_random", size,
            [&] {
                std::unordered_map<std::int64_t, std::int64_t> table;
                for (std::int64_t key : keys) {
                    table[key] = key;
                }
                ankerl::nanobench::doNotOptimizeAway(&table);
            });
        ankerl::nanobench::render(benchmark_json_template(), std_table_bench, g_output);

        const auto table = build_table(keys);
        fmt::print("  {} keys: HashTable holds {} bytes ({})\n",
                   size, table.get_allocated_bytes(), to_string(table.get_memory_stats()));
        fmt::print("  {} keys: PersistentMap {}\n", size, to_string(build_map(keys).get_memory_stats()));
    }
}

void bench_macro_lookup() {
    for (std::uint32_t size : SIZES) {
        const auto keys = generate_random_keys(size, size * 4);
        const auto probes = generate_random_keys(size, size * 4, 7);
        const auto suffix = std::to_string(size);
        const auto map = build_map(keys);
        const auto table = build_table(keys);

        auto map_bench = run_macro_benchmark(
            "persistent_map_find_" + suffix, "PersistentMap", "find_random", size,
            [&] {
                std::size_t hits = 0;
                for (std::int64_t key : probes) {
                    hits += map.contains(key) ? 1 : 0;
                }
                ankerl::nanobench::doNotOptimizeAway(hits);
            });
        ankerl::nanobench::render(benchmark_json_template(), map_bench, g_output);

        auto table_bench = run_macro_benchmark(
            "hashtable_find_" + suffix, "HashTable", "find_random", size,
            [&] {
                std::size_t hits = 0;
                for (std::int64_t key : probes) {
                    hits += table.contains(key) ? 1 : 0;
                }
                ankerl::nanobench::doNotOptimizeAway(hits);
            });
        ankerl::nanobench::render(benchmark_json_template(), table_bench, g_output);
    }
}

// Each step keeps the previous version alive: the persistent map shares structure,
// the hashtable has to be copied whole.
void bench_macro_versions() {
    const std::uint32_t size = 10000;
    const std::uint32_t steps = 100;
    const auto keys = generate_random_keys(size, size * 4);
    const auto edits = generate_random_keys(steps, size * 4, 7);
    const auto base_map = build_map(keys);
    const auto base_table = build_table(keys);

    auto map_bench = run_macro_benchmark(
        "persistent_map_versions", "PersistentMap", "keep_versions", steps,
        [&] {
            std::vector<Map> versions{base_map};
            for (std::int64_t key : edits) {
                versions.push_back(versions.back().insert(key, -key));
            }
            ankerl::nanobench::doNotOptimizeAway(versions.data());
        });
    ankerl::nanobench::render(benchmark_json_template(), map_bench, g_output);

    auto table_bench = run_macro_benchmark(
        "hashtable_versions", "HashTable", "keep_versions", steps,
        [&] {
            std::vector<Table> versions;
            versions.push_back(base_table.copy());
            for (std::int64_t key : edits) {
                auto next = versions.back().copy();
                next.set(key, -key);
                versions.push_back(std::move(next));
            }
            ankerl::nanobench::doNotOptimizeAway(versions.data());
        });
    ankerl::nanobench::render(benchmark_json_template(), table_bench, g_output);
}

void bench_macro_diff() {
    for (std::uint32_t size : SIZES) {
        const auto keys = generate_random_keys(size, size * 4);
        const auto base = build_map(keys);
        auto edited = base;
        for (std::int64_t key : generate_random_keys(10, size * 4, 7)) {
            edited = edited.insert(key, -key);
        }
        const auto rebuilt = build_map(keys);

        auto related_bench = run_macro_benchmark(
            "persistent_map_diff_related_" + std::to_string(size), "PersistentMap", "diff_shared", size,
            [&] {
                auto diff = base.symmetric_diff(edited);
                ankerl::nanobench::doNotOptimizeAway(diff.data());
            });
        ankerl::nanobench::render(benchmark_json_template(), related_bench, g_output);

        auto unrelated_bench = run_macro_benchmark(
            "persistent_map_diff_unshared_" + std::to_string(size), "PersistentMap", "diff_unshared", size,
            [&] {
                auto diff = base.symmetric_diff(rebuilt);
                ankerl::nanobench::doNotOptimizeAway(diff.data());
            });
        ankerl::nanobench::render(benchmark_json_template(), unrelated_bench, g_output);
    }
}

void bench_macro_set_operations() {
    for (std::uint32_t size : SIZES) {
        const auto left_keys = generate_random_keys(size, size * 2);
        const auto right_keys = generate_random_keys(size / 2 + 1, size * 2, 7);
        const auto suffix = std::to_string(size);

        const auto ordered_left = OrderedSet<std::int64_t>::from_range(Comparator<std::int64_t>::standard(), left_keys);
        const auto ordered_right = OrderedSet<std::int64_t>::from_range(Comparator<std::int64_t>::standard(), right_keys);

        HashSet<std::int64_t> hashed_left;
        HashSet<std::int64_t> hashed_right;
        for (std::int64_t key : left_keys) hashed_left.add(key);
        for (std::int64_t key : right_keys) hashed_right.add(key);

        auto ordered_union = run_macro_benchmark(
            "ordered_set_union_" + suffix, "OrderedSet", "union", size,
            [&] {
                auto result = ordered_left | ordered_right;
                ankerl::nanobench::doNotOptimizeAway(result.size());
            });
        ankerl::nanobench::render(benchmark_json_template(), ordered_union, g_output);

        auto hashed_union = run_macro_benchmark(
            "hash_set_union_" + suffix, "HashSet", "union", size,
            [&] {
                auto result = hashed_left | hashed_right;
                ankerl::nanobench::doNotOptimizeAway(result.size());
            });
        ankerl::nanobench::render(benchmark_json_template(), hashed_union, g_output);

        auto ordered_intersection = run_macro_benchmark(
            "ordered_set_intersection_" + suffix, "OrderedSet", "intersection", size,
            [&] {
                auto result = ordered_left & ordered_right;
                ankerl::nanobench::doNotOptimizeAway(result.size());
            });
        ankerl::nanobench::render(benchmark_json_template(), ordered_intersection, g_output);

        auto hashed_intersection = run_macro_benchmark(
            "hash_set_intersection_" + suffix, "HashSet", "intersection", size,
            [&] {
                auto result = hashed_left & hashed_right;
                ankerl::nanobench::doNotOptimizeAway(result.size());
            });
        ankerl::nanobench::render(benchmark_json_template(), hashed_intersection, g_output);
    }
}
