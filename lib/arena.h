#ifndef ARENA_H
#define ARENA_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdlib.h>
#include <stdbool.h>

/**
 * Chunk-Based Arena Allocator - Fast sequential allocation with bulk deallocation
 *
 * Provides:
 * - O(1) bump-pointer allocation
 * - Adaptive chunk sizing (4KB -> 64KB)
 * - Zero per-allocation metadata overhead
 * - Bulk reset/destroy operations
 */

// Default chunk size configurations
#define ARENA_INITIAL_CHUNK_SIZE  (4 * 1024)    // 4KB - start small
#define ARENA_MAX_CHUNK_SIZE      (64 * 1024)   // 64KB - efficient maximum
#define ARENA_DEFAULT_ALIGNMENT   16            // 16-byte SIMD alignment

/**
 * Opaque arena structure - use accessor functions
 */
typedef struct Arena Arena;

/**
 * Create a new arena with custom chunk sizes
 * @param initial_chunk_size Starting chunk size in bytes
 * @param max_chunk_size Maximum chunk size limit in bytes
 * @return Pointer to new arena, or NULL on failure
 */
Arena* arena_create(size_t initial_chunk_size, size_t max_chunk_size);

/**
 * Create a new arena with default settings (4KB initial, 64KB max, adaptive)
 * @return Pointer to new arena, or NULL on failure
 */
Arena* arena_create_default(void);

/**
 * Destroy an arena and free all chunks
 * @param arena Arena to destroy
 */
void arena_destroy(Arena* arena);

/**
 * Allocate memory from arena with default alignment
 * @param arena Arena to allocate from
 * @param size Size in bytes to allocate
 * @return Pointer to allocated memory, or NULL on failure
 */
void* arena_alloc(Arena* arena, size_t size);

/**
 * Allocate zero-initialized memory from arena
 * @param arena Arena to allocate from
 * @param size Size in bytes to allocate and zero
 * @return Pointer to zeroed memory, or NULL on failure
 */
void* arena_calloc(Arena* arena, size_t size);

/**
 * Duplicate a string in arena
 * @param arena Arena to allocate from
 * @param str String to duplicate (null-terminated)
 * @return Pointer to duplicated string, or NULL on failure
 */
char* arena_strdup(Arena* arena, const char* str);

/**
 * Duplicate a string with length limit in arena
 * @param arena Arena to allocate from
 * @param str String to duplicate
 * @param n Maximum number of characters to copy
 * @return Pointer to duplicated string, or NULL on failure
 */
char* arena_strndup(Arena* arena, const char* str, size_t n);

/**
 * Reset arena to beginning, keeping all chunks for reuse
 * @param arena Arena to reset
 */
void arena_reset(Arena* arena);

/**
 * Get total bytes allocated (all chunks)
 */
size_t arena_total_allocated(Arena* arena);

/**
 * Get total bytes actually used by allocations
 */
size_t arena_total_used(Arena* arena);

/**
 * Get number of chunks currently allocated
 */
size_t arena_chunk_count(Arena* arena);

#ifdef __cplusplus
}
#endif

#endif // ARENA_H
