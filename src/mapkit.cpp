/**
 * @file mapkit.cpp
 * @brief C API implementation for mapkit
 */

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <new>
#include <optional>
#include <utility>

#include "mapkit.h"
#include "MapKit/HashTable.hpp"
#include "MapKit/PersistentMap.hpp"

struct mapkit_map {
    PersistentMap<std::int64_t, std::int64_t> map{};
};

struct mapkit_table {
    HashTable<std::int64_t, std::int64_t> table{};
};

template<typename Handle, typename... Args>
static Handle* make_handle(Args&&... args) {
    auto* p{static_cast<Handle*>(std::malloc(sizeof(Handle)))};
    if (p == nullptr) {
        return nullptr;
    }
    try {
        std::construct_at(p, Handle{std::forward<Args>(args)...});
        return p;
    } catch (const std::bad_alloc&) {
        std::free(p);
        return nullptr;
    }
}

template<typename Handle>
static void free_handle(Handle* p) {
    if (p != nullptr) {
        std::destroy_at(p);
        std::free(p);
    }
}

static mapkit_optional_t to_c_optional(std::optional<std::int64_t> opt) {
    if (opt.has_value()) {
        return {true, opt.value()};
    } else {
        return {false, 0};
    }
}

static mapkit_binding_t to_c_binding(std::optional<std::pair<std::int64_t, std::int64_t>> opt) {
    if (opt.has_value()) {
        return {true, opt->first, opt->second};
    } else {
        return {false, 0, 0};
    }
}

static mapkit_stats_t to_c_stats(const MemoryStats& stats) {
    return mapkit_stats_t{
        .total_nodes = stats.total_nodes,
        .max_depth = stats.max_depth,
        .total_buckets = stats.total_buckets,
        .used_buckets = stats.used_buckets,
    };
}

mapkit_map_t mapkit_map_create() {
    return make_handle<mapkit_map>();
}

void mapkit_map_destroy(mapkit_map_t handle) {
    free_handle(handle);
}

mapkit_map_t mapkit_map_insert(const_mapkit_map_t handle, int64_t key, int64_t value) {
    assert(handle != nullptr);
    try {
        return make_handle<mapkit_map>(handle->map.insert(key, value));
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

mapkit_map_t mapkit_map_remove(const_mapkit_map_t handle, int64_t key) {
    assert(handle != nullptr);
    try {
        return make_handle<mapkit_map>(handle->map.remove(key));
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

mapkit_optional_t mapkit_map_find(const_mapkit_map_t handle, int64_t key) {
    assert(handle != nullptr);
    return to_c_optional(handle->map.find(key));
}

bool mapkit_map_contains(const_mapkit_map_t handle, int64_t key) {
    assert(handle != nullptr);
    return handle->map.contains(key);
}

size_t mapkit_map_size(const_mapkit_map_t handle) {
    assert(handle != nullptr);
    return handle->map.size();
}

mapkit_binding_t mapkit_map_min(const_mapkit_map_t handle) {
    assert(handle != nullptr);
    return to_c_binding(handle->map.min());
}

mapkit_binding_t mapkit_map_max(const_mapkit_map_t handle) {
    assert(handle != nullptr);
    return to_c_binding(handle->map.max());
}

mapkit_binding_t mapkit_map_successor(const_mapkit_map_t handle, int64_t key) {
    assert(handle != nullptr);
    return to_c_binding(handle->map.successor(key));
}

mapkit_binding_t mapkit_map_predecessor(const_mapkit_map_t handle, int64_t key) {
    assert(handle != nullptr);
    return to_c_binding(handle->map.predecessor(key));
}

// Every handle uses the standard comparator, so the identity check inside the diff cannot fail.
size_t mapkit_map_diff_count(const_mapkit_map_t handle1, const_mapkit_map_t handle2) {
    assert(handle1 != nullptr && handle2 != nullptr);
    try {
        return handle1->map.symmetric_diff(handle2->map).size();
    } catch (const std::bad_alloc&) {
        return 0;
    }
}

bool mapkit_map_equals(const_mapkit_map_t handle1, const_mapkit_map_t handle2) {
    assert(handle1 != nullptr && handle2 != nullptr);
    try {
        return handle1->map == handle2->map;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

int64_t* mapkit_map_keys(const_mapkit_map_t handle, size_t *out_len) {
    assert(handle != nullptr);
    assert(out_len != nullptr);
    std::size_t len = handle->map.size();
    *out_len = len;
    if (len == 0) {
        return nullptr;
    }
    auto* array = static_cast<int64_t*>(std::malloc(len * sizeof(int64_t)));
    if (array == nullptr) {
        *out_len = 0;
        return nullptr;
    }
    try {
        std::size_t i = 0;
        for (const auto& [key, value] : handle->map) {
            array[i++] = key;
        }
    } catch (const std::bad_alloc&) {
        std::free(array);
        *out_len = 0;
        return nullptr;
    }
    return array;
}

mapkit_stats_t mapkit_map_get_stats(const_mapkit_map_t handle) {
    assert(handle != nullptr);
    return to_c_stats(handle->map.get_memory_stats());
}

mapkit_table_t mapkit_table_create(size_t initial_size) {
    try {
        return make_handle<mapkit_table>(
            HashTable<std::int64_t, std::int64_t>{Hasher<std::int64_t>::standard(), initial_size});
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

void mapkit_table_destroy(mapkit_table_t handle) {
    free_handle(handle);
}

bool mapkit_table_set(mapkit_table_t handle, int64_t key, int64_t value) {
    assert(handle != nullptr);
    try {
        handle->table.set(key, value);
        return true;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

bool mapkit_table_add(mapkit_table_t handle, int64_t key, int64_t value) {
    assert(handle != nullptr);
    try {
        return handle->table.add(key, value);
    } catch (const std::bad_alloc&) {
        return false;
    }
}

bool mapkit_table_remove(mapkit_table_t handle, int64_t key) {
    assert(handle != nullptr);
    return handle->table.remove(key);
}

mapkit_optional_t mapkit_table_find(const_mapkit_table_t handle, int64_t key) {
    assert(handle != nullptr);
    return to_c_optional(handle->table.find(key));
}

bool mapkit_table_contains(const_mapkit_table_t handle, int64_t key) {
    assert(handle != nullptr);
    return handle->table.contains(key);
}

size_t mapkit_table_size(const_mapkit_table_t handle) {
    assert(handle != nullptr);
    return handle->table.size();
}

mapkit_table_t mapkit_table_copy(const_mapkit_table_t handle) {
    assert(handle != nullptr);
    try {
        return make_handle<mapkit_table>(handle->table.copy());
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

void mapkit_table_clear(mapkit_table_t handle) {
    assert(handle != nullptr);
    handle->table.clear();
}

size_t mapkit_table_bucket_count(const_mapkit_table_t handle) {
    assert(handle != nullptr);
    return handle->table.bucket_count();
}

size_t mapkit_table_allocated_memory(const_mapkit_table_t handle) {
    assert(handle != nullptr);
    return handle->table.get_allocated_bytes();
}

mapkit_stats_t mapkit_table_get_stats(const_mapkit_table_t handle) {
    assert(handle != nullptr);
    return to_c_stats(handle->table.get_memory_stats());
}
