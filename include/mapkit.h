/**
 * @file mapkit.h
 * @brief C API for mapkit - persistent ordered maps and tree-bucket hashtables
 *
 * Public C interface for the mapkit library (libmapkit), specialised to int64_t keys and
 * values ordered and hashed in the natural way.
 *
 * Persistent maps are immutable: every update returns a new handle and leaves its argument
 * valid. Old and new handles share structure internally but are destroyed independently.
 * Hashtables are mutable and are not safe for concurrent mutation.
 */

#ifndef MAPKIT_H
#define MAPKIT_H

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Opaque handle to a persistent ordered map version
 */
typedef struct mapkit_map* mapkit_map_t;
typedef const struct mapkit_map* const_mapkit_map_t;

/**
 * @brief Opaque handle to a mutable hashtable
 */
typedef struct mapkit_table* mapkit_table_t;
typedef const struct mapkit_table* const_mapkit_table_t;

/**
 * @brief Result structure for lookups that may find nothing
 */
typedef struct {
    bool has_value;
    int64_t value;
} mapkit_optional_t;

/**
 * @brief Result structure for queries returning a whole binding
 */
typedef struct {
    bool has_value;
    int64_t key;
    int64_t value;
} mapkit_binding_t;

/**
 * @brief Memory statistics structure
 */
typedef struct {
    size_t total_nodes;
    size_t max_depth;
    size_t total_buckets;
    size_t used_buckets;
} mapkit_stats_t;

/* ---------------------------------------------------------------------------------------------
 * Persistent ordered map
 * ------------------------------------------------------------------------------------------- */

/**
 * @brief Create a new empty map
 *
 * @return mapkit_map_t Handle to the created map, or NULL on failure.
 *
 * Note: Every handle returned by this API must be matched with a call to mapkit_map_destroy().
 */
mapkit_map_t mapkit_map_create(void);

/**
 * @brief Destroy a map handle; other versions are unaffected
 */
void mapkit_map_destroy(mapkit_map_t handle);

/**
 * @brief Return a new version with key bound to value
 *
 * @return Handle to the new version, or NULL on allocation failure
 */
mapkit_map_t mapkit_map_insert(const_mapkit_map_t handle, int64_t key, int64_t value);

/**
 * @brief Return a new version without key
 *
 * @return Handle to the new version, or NULL on allocation failure
 */
mapkit_map_t mapkit_map_remove(const_mapkit_map_t handle, int64_t key);

/**
 * @brief Look up the value bound to key
 */
mapkit_optional_t mapkit_map_find(const_mapkit_map_t handle, int64_t key);

bool mapkit_map_contains(const_mapkit_map_t handle, int64_t key);

size_t mapkit_map_size(const_mapkit_map_t handle);

/**
 * @brief Binding with the smallest key
 */
mapkit_binding_t mapkit_map_min(const_mapkit_map_t handle);

/**
 * @brief Binding with the largest key
 */
mapkit_binding_t mapkit_map_max(const_mapkit_map_t handle);

/**
 * @brief Binding with the smallest key strictly greater than key
 */
mapkit_binding_t mapkit_map_successor(const_mapkit_map_t handle, int64_t key);

/**
 * @brief Binding with the largest key strictly smaller than key
 */
mapkit_binding_t mapkit_map_predecessor(const_mapkit_map_t handle, int64_t key);

/**
 * @brief Number of keys that are bound in only one map or bound to different values
 * @return The count, or 0 if memory allocation fails
 */
size_t mapkit_map_diff_count(const_mapkit_map_t handle1, const_mapkit_map_t handle2);

/**
 * @brief Check if two maps hold the same bindings
 * @return false if memory allocation fails
 */
bool mapkit_map_equals(const_mapkit_map_t handle1, const_mapkit_map_t handle2);

/**
 * @brief Copy keys in ascending order to a new array (caller must free)
 *
 * @param out_len Output parameter for array length
 * @return Pointer to allocated array, or NULL if empty or on error. Caller must free.
 */
int64_t* mapkit_map_keys(const_mapkit_map_t handle, size_t *out_len);

mapkit_stats_t mapkit_map_get_stats(const_mapkit_map_t handle);

/* ---------------------------------------------------------------------------------------------
 * Mutable hashtable
 * ------------------------------------------------------------------------------------------- */

/**
 * @brief Create a new empty hashtable sized for about initial_size entries
 *
 * @return Handle to the created table, or NULL on failure.
 */
mapkit_table_t mapkit_table_create(size_t initial_size);

void mapkit_table_destroy(mapkit_table_t handle);

/**
 * @brief Bind key to value, replacing any previous binding
 *
 * @return false on allocation failure
 */
bool mapkit_table_set(mapkit_table_t handle, int64_t key, int64_t value);

/**
 * @brief Bind key to value only if key is absent
 *
 * @return true if the binding was added
 */
bool mapkit_table_add(mapkit_table_t handle, int64_t key, int64_t value);

/**
 * @return true if a binding was removed
 */
bool mapkit_table_remove(mapkit_table_t handle, int64_t key);

mapkit_optional_t mapkit_table_find(const_mapkit_table_t handle, int64_t key);

bool mapkit_table_contains(const_mapkit_table_t handle, int64_t key);

size_t mapkit_table_size(const_mapkit_table_t handle);

/**
 * @brief Deep copy of a table; the copy and the original evolve independently
 *
 * @return Handle to the copy, or NULL on failure.
 */
mapkit_table_t mapkit_table_copy(const_mapkit_table_t handle);

void mapkit_table_clear(mapkit_table_t handle);

size_t mapkit_table_bucket_count(const_mapkit_table_t handle);

/**
 * @brief Get the amount of currently allocated bytes
 */
size_t mapkit_table_allocated_memory(const_mapkit_table_t handle);

mapkit_stats_t mapkit_table_get_stats(const_mapkit_table_t handle);

#ifdef __cplusplus
}
#endif

#endif /* MAPKIT_H */
