/* =================================================================
 * include/Infiniloom/infiniloom_embed.h
 * =================================================================
 * Raw byte-oriented surface for sandboxed hosts: token counting,
 * compression, language detection and binary sniffing. No handle,
 * no filesystem access.
 *
 * Text goes in and out as pointer + length pairs. Memory the library
 * hands back (infiniloom_embed_compress_alloc) comes from the host
 * allocator installed with infiniloom_embed_set_allocator, or from
 * malloc/free when none is installed.
 */

#pragma once

#include "Infiniloom/infiniloom.h"

#ifdef __cplusplus
extern "C" {
#endif

#define INFINILOOM_EMBED_ERR_FAILED           -1
#define INFINILOOM_EMBED_ERR_BUFFER_TOO_SMALL -2

typedef void* (*infiniloom_embed_alloc_fn)(size_t size);
typedef void (*infiniloom_embed_free_fn)(void* ptr, size_t size);

/* Install host allocation primitives; passing NULL for either restores malloc/free */
INFINILOOM_API void infiniloom_embed_set_allocator(infiniloom_embed_alloc_fn alloc_fn,
                                                   infiniloom_embed_free_fn free_fn);

/* Allocate and release through the installed primitives. NULL on failure. */
INFINILOOM_API void* infiniloom_embed_alloc(size_t size);
INFINILOOM_API void infiniloom_embed_free(void* ptr, size_t size);

/* Heuristic count for one model; 0 for an unknown model code */
INFINILOOM_API uint32_t infiniloom_embed_count_tokens(const char* text, size_t len, uint8_t model);

/* Counts for every model into out[INFINILOOM_MODEL_COUNT], in model code order */
INFINILOOM_API void infiniloom_embed_count_tokens_all(const char* text, size_t len, uint32_t* out);

/**
 * Compress with the defaults of a level into a caller buffer.
 * Returns the length, INFINILOOM_EMBED_ERR_BUFFER_TOO_SMALL or
 * INFINILOOM_EMBED_ERR_FAILED.
 */
INFINILOOM_API int64_t infiniloom_embed_compress(const char* text,
                                                 size_t len,
                                                 uint8_t level,
                                                 uint8_t language,
                                                 char* out,
                                                 size_t out_size);

/**
 * Compress into a NUL-terminated buffer from the host allocator.
 * The length goes to *out_len; release with
 * infiniloom_embed_free(ptr, *out_len + 1). NULL on failure.
 */
INFINILOOM_API char* infiniloom_embed_compress_alloc(const char* text,
                                                     size_t len,
                                                     uint8_t level,
                                                     uint8_t language,
                                                     size_t* out_len);

/* Language code from a file name, INFINILOOM_LANG_UNKNOWN if none */
INFINILOOM_API uint8_t infiniloom_embed_detect_language(const char* filename, size_t len);

INFINILOOM_API uint8_t infiniloom_embed_is_binary(const char* data, size_t len);

INFINILOOM_API const char* infiniloom_embed_version(void);

#ifdef __cplusplus
}
#endif
