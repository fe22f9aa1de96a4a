#include "benchmark.hpp"
#include "MapKit/PersistentMap.hpp"
#include <nanobench.h>
#include <cstdint>
#include <iostream>
#include <map>

void bench_map_micro() {
    std::cout << "[PersistentMap Microbenchmarks]\n";

    const std::uint32_t KEY_RANGE = 1000000;
    ankerl::nanobench::Rng rng;

    {
        PersistentMap<std::int64_t, std::int64_t> map;
        ankerl::nanobench::Bench().minEpochIterations(1000).run("PersistentMap Insert (random)", [&]() {
            map = map.insert(static_cast<std::int64_t>(rng.bounded(KEY_RANGE)), 1);
            ankerl::nanobench::doNotOptimizeAway(&map);
        });
    }

    {
        PersistentMap<std::int64_t, std::int64_t> map;
        std::int64_t counter = 0;
        ankerl::nanobench::Bench().minEpochIterations(1000).run("PersistentMap Insert (sequential)", [&]() {
            map = map.insert(counter++, 1);
            ankerl::nanobench::doNotOptimizeAway(&map);
        });
    }

    {
        std::map<std::int64_t, std::int64_t> map;
        ankerl::nanobench::Bench().minEpochIterations(1000).run("std::map Insert (random)", [&]() {
            map[static_cast<std::int64_t>(rng.bounded(KEY_RANGE))] = 1;
            ankerl::nanobench::doNotOptimizeAway(&map);
        });
    }

    {
        PersistentMap<std::int64_t, std::int64_t> map;
        for (std::int64_t key : generate_random_keys(10000, KEY_RANGE)) {
            map = map.insert(key, key);
        }
        ankerl::nanobench::Bench().minEpochIterations(10000).run("PersistentMap Find", [&]() {
            ankerl::nanobench::doNotOptimizeAway(map.find(static_cast<std::int64_t>(rng.bounded(KEY_RANGE))));
        });
    }

    {
        std::map<std::int64_t, std::int64_t> map;
        for (std::int64_t key : generate_random_keys(10000, KEY_RANGE)) {
            map[key] = key;
        }
        ankerl::nanobench::Bench().minEpochIterations(10000).run("std::map Find", [&]() {
            ankerl::nanobench::doNotOptimizeAway(map.find(static_cast<std::int64_t>(rng.bounded(KEY_RANGE))));
        });
    }

    {
        PersistentMap<std::int64_t, std::int64_t> map;
        const auto keys = generate_random_keys(10000, KEY_RANGE);
        for (std::int64_t key : keys) {
            map = map.insert(key, key);
        }
        std::uint32_t idx = 0;
        ankerl::nanobench::Bench().minEpochIterations(1000).run("PersistentMap Remove", [&]() {
            auto smaller = map.remove(keys[idx++ % keys.size()]);
            ankerl::nanobench::doNotOptimizeAway(&smaller);
        });
    }

    {
        PersistentMap<std::int64_t, std::int64_t> map;
        for (std::int64_t key : generate_random_keys(10000, KEY_RANGE)) {
            map = map.insert(key, key);
        }
        ankerl::nanobench::Bench().minEpochIterations(10000).run("PersistentMap Successor", [&]() {
            ankerl::nanobench::doNotOptimizeAway(map.successor(static_cast<std::int64_t>(rng.bounded(KEY_RANGE))));
        });
    }

    {
        PersistentMap<std::int64_t, std::int64_t> map;
        for (std::int64_t key : generate_random_keys(10000, KEY_RANGE)) {
            map = map.insert(key, key);
        }
        ankerl::nanobench::Bench().minEpochIterations(100).run("PersistentMap Iterate", [&]() {
            std::int64_t sum = 0;
            for (const auto& [key, value] : map) {
                sum += value;
            }
            ankerl::nanobench::doNotOptimizeAway(sum);
        });
    }
}
