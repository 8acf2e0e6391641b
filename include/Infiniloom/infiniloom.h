/* =================================================================
 * include/Infiniloom/infiniloom.h
 * =================================================================
 * C ABI for the scanning, token counting and compression core.
 *
 * Ownership rules:
 *   - A context comes from infiniloom_init() and goes back through
 *     exactly one infiniloom_free().
 *   - Every infiniloom_file_info filled by infiniloom_get_file() owns
 *     copies of its strings and must be passed to
 *     infiniloom_free_file_info() before it is discarded.
 *   - Strings returned by infiniloom_get_error() and
 *     infiniloom_version() belong to the library. The error string is
 *     valid until the next call on the same context.
 *
 * A context must not be used from two threads at the same time.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
    #define INFINILOOM_API __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define INFINILOOM_API __attribute__((visibility("default")))
#else
    #define INFINILOOM_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

#define INFINILOOM_VERSION "0.1.0"

/* Status codes */
#define INFINILOOM_OK                       0
#define INFINILOOM_ERR_INVALID_HANDLE      -1
#define INFINILOOM_ERR_FAILED              -2
#define INFINILOOM_ERR_BUFFER_TOO_SMALL    -3
#define INFINILOOM_ERR_INVALID_ARGUMENT    -4
#define INFINILOOM_ERR_OUT_OF_MEMORY       -5

/* Tokenizer models */
#define INFINILOOM_MODEL_CLAUDE     0
#define INFINILOOM_MODEL_GPT4O      1
#define INFINILOOM_MODEL_GPT4       2
#define INFINILOOM_MODEL_GEMINI     3
#define INFINILOOM_MODEL_LLAMA      4
#define INFINILOOM_MODEL_CODELLAMA  5
#define INFINILOOM_MODEL_COUNT      6

/* Compression levels */
#define INFINILOOM_LEVEL_NONE        0
#define INFINILOOM_LEVEL_MINIMAL     1
#define INFINILOOM_LEVEL_BALANCED    2
#define INFINILOOM_LEVEL_AGGRESSIVE  3
#define INFINILOOM_LEVEL_EXTREME     4

/* Language codes */
#define INFINILOOM_LANG_PYTHON      0
#define INFINILOOM_LANG_JAVASCRIPT  1
#define INFINILOOM_LANG_TYPESCRIPT  2
#define INFINILOOM_LANG_RUST        3
#define INFINILOOM_LANG_GO          4
#define INFINILOOM_LANG_JAVA        5
#define INFINILOOM_LANG_C           6
#define INFINILOOM_LANG_CPP         7
#define INFINILOOM_LANG_CSHARP      8
#define INFINILOOM_LANG_RUBY        9
#define INFINILOOM_LANG_PHP         10
#define INFINILOOM_LANG_UNKNOWN     255

typedef struct infiniloom_context infiniloom_context;

/* Aggregate result of one scan */
typedef struct infiniloom_scan_result {
    uint32_t file_count;
    uint64_t total_bytes;
    uint64_t total_tokens;      /* Claude estimate of loaded content, size / 4 otherwise */
    int64_t scan_time_ms;
    int32_t error_code;         /* INFINILOOM_OK or a negative status code */
    uint32_t skipped_binary;
    uint32_t skipped_size;
    uint32_t skipped_ignored;
    uint32_t skipped_hidden;
    uint32_t skipped_extension;
    uint32_t skipped_unreadable;
    uint32_t directories_failed;
} infiniloom_scan_result;

/* One scanned file. Strings are NUL-terminated and owned by the record. */
typedef struct infiniloom_file_info {
    const char* path;
    uint32_t path_len;
    const char* relative_path;
    uint32_t relative_path_len;
    uint64_t size_bytes;
    uint32_t token_count_claude;
    uint32_t token_count_gpt4o;
    const char* language;       /* "" when unknown */
    uint8_t language_len;
    uint8_t is_binary;
} infiniloom_file_info;

typedef struct infiniloom_token_counts {
    uint32_t claude;
    uint32_t gpt4o;
    uint32_t gpt4;
    uint32_t gemini;
    uint32_t llama;
    uint32_t codellama;
} infiniloom_token_counts;

typedef struct infiniloom_compression_config {
    uint8_t level;              /* INFINILOOM_LEVEL_* */
    uint8_t remove_comments;
    uint8_t remove_empty_lines;
    uint8_t preserve_imports;
} infiniloom_compression_config;

typedef struct infiniloom_scan_options {
    uint8_t include_hidden;
    uint8_t respect_gitignore;
    uint8_t read_contents;
    uint8_t use_mmap;
    uint8_t follow_symlinks;
    uint64_t max_file_size;
    uint64_t mmap_threshold;
    uint32_t max_threads;
} infiniloom_scan_options;

/* Context lifecycle */
INFINILOOM_API infiniloom_context* infiniloom_init(void);
INFINILOOM_API void infiniloom_free(infiniloom_context* ctx);
INFINILOOM_API const char* infiniloom_get_error(infiniloom_context* ctx);
INFINILOOM_API const char* infiniloom_version(void);

/**
 * Apply a YAML configuration file to a context: scan defaults,
 * vocabularies and logging. A missing file leaves the defaults.
 */
INFINILOOM_API int32_t infiniloom_load_config(infiniloom_context* ctx, const char* path);

/* Fill options with the context's current scan settings */
INFINILOOM_API int32_t infiniloom_scan_options_default(infiniloom_context* ctx, infiniloom_scan_options* out);

/* Scanning. Each scan replaces the files held by the context. */
INFINILOOM_API infiniloom_scan_result infiniloom_scan(infiniloom_context* ctx,
                                                      const char* path,
                                                      uint8_t include_hidden,
                                                      uint8_t respect_gitignore,
                                                      uint64_t max_file_size);

INFINILOOM_API infiniloom_scan_result infiniloom_scan_parallel(infiniloom_context* ctx,
                                                               const char* path,
                                                               uint8_t include_hidden,
                                                               uint8_t respect_gitignore,
                                                               uint64_t max_file_size);

/* options may be NULL to use the context's settings */
INFINILOOM_API infiniloom_scan_result infiniloom_scan_ex(infiniloom_context* ctx,
                                                         const char* path,
                                                         const infiniloom_scan_options* options,
                                                         uint8_t parallel);

/* Per-file access */
INFINILOOM_API uint32_t infiniloom_get_file_count(infiniloom_context* ctx);
INFINILOOM_API int32_t infiniloom_get_file(infiniloom_context* ctx, uint32_t index, infiniloom_file_info* out);

/* Release the strings of a record; safe to call twice */
INFINILOOM_API void infiniloom_free_file_info(infiniloom_file_info* info);

/**
 * Copy the loaded content of a file (scan with read_contents).
 * Returns the length, INFINILOOM_ERR_BUFFER_TOO_SMALL (see
 * infiniloom_last_required_size) or another negative code.
 */
INFINILOOM_API int64_t infiniloom_get_file_content(infiniloom_context* ctx,
                                                   uint32_t index,
                                                   char* buffer,
                                                   uint64_t buffer_size);

/* Token counting. Returns the count or a negative code. */
INFINILOOM_API int64_t infiniloom_count_tokens(infiniloom_context* ctx,
                                               const char* text,
                                               size_t text_len,
                                               uint8_t model);

INFINILOOM_API int32_t infiniloom_count_tokens_all(infiniloom_context* ctx,
                                                   const char* text,
                                                   size_t text_len,
                                                   infiniloom_token_counts* out);

/* Load a tiktoken rank file or a tokenizer.json for exact counts */
INFINILOOM_API int32_t infiniloom_load_vocabulary(infiniloom_context* ctx, uint8_t model, const char* path);

/**
 * Compress text into a caller buffer. Returns the written length,
 * INFINILOOM_ERR_BUFFER_TOO_SMALL or another negative code. When the
 * buffer is too small the result is kept, so a retry with a buffer of
 * infiniloom_last_required_size() bytes returns the same output.
 */
INFINILOOM_API int64_t infiniloom_compress(infiniloom_context* ctx,
                                           const char* text,
                                           size_t text_len,
                                           infiniloom_compression_config config,
                                           uint8_t language,
                                           char* out_buffer,
                                           size_t buffer_size);

INFINILOOM_API uint64_t infiniloom_last_required_size(infiniloom_context* ctx);

/* Stateless helpers */
INFINILOOM_API uint8_t infiniloom_detect_language(const char* filename);
INFINILOOM_API uint8_t infiniloom_is_binary(const char* data, size_t len);

#ifdef __cplusplus
}
#endif
