// =================================================================
// src/Infiniloom/CApi.cpp
// =================================================================
// C ABI shim over the scanners, the token estimator and the
// compressor. Exceptions stop here and become status codes.

#include "Infiniloom/infiniloom.h"
#include "Infiniloom/AbiCodes.hpp"
#include "Infiniloom/ContentClassifier.hpp"
#include "Infiniloom/DirectoryScanner.hpp"
#include "Infiniloom/EngineConfig.hpp"
#include "Infiniloom/Logger.hpp"
#include "Infiniloom/ParallelScanner.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <vector>

struct infiniloom_context {
    Infiniloom::EngineConfig config;
    Infiniloom::TokenEstimator estimator;
    std::vector<Infiniloom::FileRecord> files;
    std::string last_error;

    // Last compression, kept so a retry after BUFFER_TOO_SMALL is a copy
    bool has_compressed = false;
    std::string compressed_input;
    infiniloom_compression_config compressed_config{};
    uint8_t compressed_language = 0;
    std::string compressed_output;

    uint64_t last_required_size = 0;
};

namespace {

using namespace Infiniloom;

const char EMPTY_STRING[] = "";

void setError(infiniloom_context* ctx, const char* message) noexcept {
    try {
        ctx->last_error = message;
    } catch (const std::bad_alloc&) {
        ctx->last_error.clear();
    }
}

void setError(infiniloom_context* ctx, const std::string& message) noexcept {
    setError(ctx, message.c_str());
}

// Literal messages take the const char* overloads so reporting them never allocates
template <typename Result>
Result fail(infiniloom_context* ctx, int32_t code, const char* message) noexcept {
    setError(ctx, message);
    return static_cast<Result>(code);
}

template <typename Result>
Result fail(infiniloom_context* ctx, int32_t code, const std::string& message) noexcept {
    setError(ctx, message.c_str());
    return static_cast<Result>(code);
}

/**
 * @brief Run an entry point body, converting exceptions to status codes
 */
template <typename Result, typename Body>
Result guarded(infiniloom_context* ctx, const char* operation, Body&& body) noexcept {
    try {
        return body();
    } catch (const std::bad_alloc&) {
        setError(ctx, "out of memory");
        return static_cast<Result>(INFINILOOM_ERR_OUT_OF_MEMORY);
    } catch (const std::exception& e) {
        setError(ctx, e.what());
        try {
            Logger::getInstance().error("CApi", std::string(operation) + " failed", e.what());
        } catch (const std::exception&) {
            // Logging is best effort here; the error is already on the handle
        }
        return static_cast<Result>(INFINILOOM_ERR_FAILED);
    } catch (...) {
        setError(ctx, "unknown exception");
        return static_cast<Result>(INFINILOOM_ERR_FAILED);
    }
}

infiniloom_scan_result makeResult(int32_t error_code) {
    infiniloom_scan_result result;
    std::memset(&result, 0, sizeof(result));
    result.error_code = error_code;
    return result;
}

uint32_t fileTokens(const infiniloom_context* ctx, const FileRecord& file, TokenizerModel model) {
    if (file.content) {
        return ctx->estimator.estimate(*file.content, model).count;
    }
    return static_cast<uint32_t>(file.size / 4);
}

infiniloom_scan_result runScan(infiniloom_context* ctx, const char* path,
                               const WalkConfiguration& config, bool parallel) {
    if (path == nullptr) {
        setError(ctx, "scan path is null");
        return makeResult(INFINILOOM_ERR_INVALID_ARGUMENT);
    }

    ctx->files.clear();

    try {
        std::unique_ptr<ScannerBase> scanner;
        if (parallel) {
            scanner = std::make_unique<ParallelScanner>(config);
        } else {
            scanner = std::make_unique<DirectoryScanner>(config);
        }

        scanner->walk(path);
        ctx->files = scanner->takeFiles();

        const ScanStatistics& stats = scanner->getStats();
        infiniloom_scan_result result = makeResult(INFINILOOM_OK);
        result.file_count = stats.total_files;
        result.total_bytes = stats.total_bytes;
        result.scan_time_ms = stats.scan_time_ms;
        result.skipped_binary = stats.skipped_binary;
        result.skipped_size = stats.skipped_size;
        result.skipped_ignored = stats.skipped_ignored;
        result.skipped_hidden = stats.skipped_hidden;
        result.skipped_extension = stats.skipped_extension;
        result.skipped_unreadable = stats.skipped_unreadable;
        result.directories_failed = stats.directories_failed;

        for (const auto& file : ctx->files) {
            result.total_tokens += fileTokens(ctx, file, TokenizerModel::CLAUDE);
        }
        return result;
    } catch (const std::bad_alloc&) {
        ctx->files.clear();
        setError(ctx, "out of memory");
        return makeResult(INFINILOOM_ERR_OUT_OF_MEMORY);
    } catch (const std::exception& e) {
        ctx->files.clear();
        setError(ctx, e.what());
        return makeResult(INFINILOOM_ERR_FAILED);
    }
}

infiniloom_scan_result simpleScan(infiniloom_context* ctx, const char* path, uint8_t include_hidden,
                                  uint8_t respect_gitignore, uint64_t max_file_size, bool parallel) {
    if (ctx == nullptr) {
        return makeResult(INFINILOOM_ERR_INVALID_HANDLE);
    }
    ctx->last_error.clear();

    try {
        WalkConfiguration config = ctx->config.scan;
        config.include_hidden = include_hidden != 0;
        config.respect_gitignore = respect_gitignore != 0;
        config.max_file_size = max_file_size;
        return runScan(ctx, path, config, parallel);
    } catch (const std::bad_alloc&) {
        setError(ctx, "out of memory");
        return makeResult(INFINILOOM_ERR_OUT_OF_MEMORY);
    }
}

char* duplicateString(const std::string& value) {
    char* copy = static_cast<char*>(std::malloc(value.size() + 1));
    if (copy != nullptr) {
        std::memcpy(copy, value.data(), value.size());
        copy[value.size()] = '\0';
    }
    return copy;
}

void releaseString(const char* value) {
    if (value != nullptr && value != EMPTY_STRING) {
        std::free(const_cast<char*>(value));
    }
}

bool sameConfig(const infiniloom_compression_config& a, const infiniloom_compression_config& b) {
    return a.level == b.level &&
           a.remove_comments == b.remove_comments &&
           a.remove_empty_lines == b.remove_empty_lines &&
           a.preserve_imports == b.preserve_imports;
}

} // namespace

extern "C" {

infiniloom_context* infiniloom_init(void) {
    try {
        return new infiniloom_context();
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

void infiniloom_free(infiniloom_context* ctx) {
    delete ctx;
}

const char* infiniloom_get_error(infiniloom_context* ctx) {
    return ctx != nullptr ? ctx->last_error.c_str() : EMPTY_STRING;
}

const char* infiniloom_version(void) {
    return INFINILOOM_VERSION;
}

int32_t infiniloom_load_config(infiniloom_context* ctx, const char* path) {
    if (ctx == nullptr) {
        return INFINILOOM_ERR_INVALID_HANDLE;
    }
    ctx->last_error.clear();
    if (path == nullptr) {
        return fail<int32_t>(ctx, INFINILOOM_ERR_INVALID_ARGUMENT, "configuration path is null");
    }

    return guarded<int32_t>(ctx, "load_config", [&]() {
        EngineConfig config = EngineConfig::loadFromFile(path);
        config.validate();

        // Nothing on the handle changes unless every vocabulary loads
        TokenEstimator estimator;
        config.applyVocabularies(estimator);

        config.applyLogging();
        ctx->estimator = std::move(estimator);
        ctx->config = std::move(config);
        return INFINILOOM_OK;
    });
}

int32_t infiniloom_scan_options_default(infiniloom_context* ctx, infiniloom_scan_options* out) {
    if (ctx == nullptr) {
        return INFINILOOM_ERR_INVALID_HANDLE;
    }
    ctx->last_error.clear();
    if (out == nullptr) {
        return fail<int32_t>(ctx, INFINILOOM_ERR_INVALID_ARGUMENT, "options pointer is null");
    }

    const WalkConfiguration& scan = ctx->config.scan;
    std::memset(out, 0, sizeof(*out));
    out->include_hidden = scan.include_hidden ? 1 : 0;
    out->respect_gitignore = scan.respect_gitignore ? 1 : 0;
    out->read_contents = scan.read_contents ? 1 : 0;
    out->use_mmap = scan.use_mmap ? 1 : 0;
    out->follow_symlinks = scan.follow_symlinks ? 1 : 0;
    out->max_file_size = scan.max_file_size;
    out->mmap_threshold = scan.mmap_threshold;
    out->max_threads = static_cast<uint32_t>(scan.max_threads);
    return INFINILOOM_OK;
}

infiniloom_scan_result infiniloom_scan(infiniloom_context* ctx, const char* path, uint8_t include_hidden,
                                       uint8_t respect_gitignore, uint64_t max_file_size) {
    return simpleScan(ctx, path, include_hidden, respect_gitignore, max_file_size, false);
}

infiniloom_scan_result infiniloom_scan_parallel(infiniloom_context* ctx, const char* path, uint8_t include_hidden,
                                                uint8_t respect_gitignore, uint64_t max_file_size) {
    return simpleScan(ctx, path, include_hidden, respect_gitignore, max_file_size, true);
}

infiniloom_scan_result infiniloom_scan_ex(infiniloom_context* ctx, const char* path,
                                          const infiniloom_scan_options* options, uint8_t parallel) {
    if (ctx == nullptr) {
        return makeResult(INFINILOOM_ERR_INVALID_HANDLE);
    }
    ctx->last_error.clear();

    try {
        WalkConfiguration config = ctx->config.scan;
        if (options != nullptr) {
            config.include_hidden = options->include_hidden != 0;
            config.respect_gitignore = options->respect_gitignore != 0;
            config.read_contents = options->read_contents != 0;
            config.use_mmap = options->use_mmap != 0;
            config.follow_symlinks = options->follow_symlinks != 0;
            config.max_file_size = options->max_file_size;
            config.mmap_threshold = options->mmap_threshold;
            config.max_threads = options->max_threads;
        }
        return runScan(ctx, path, config, parallel != 0);
    } catch (const std::bad_alloc&) {
        setError(ctx, "out of memory");
        return makeResult(INFINILOOM_ERR_OUT_OF_MEMORY);
    }
}

uint32_t infiniloom_get_file_count(infiniloom_context* ctx) {
    return ctx != nullptr ? static_cast<uint32_t>(ctx->files.size()) : 0;
}

int32_t infiniloom_get_file(infiniloom_context* ctx, uint32_t index, infiniloom_file_info* out) {
    if (ctx == nullptr) {
        return INFINILOOM_ERR_INVALID_HANDLE;
    }
    ctx->last_error.clear();
    if (out == nullptr) {
        return fail<int32_t>(ctx, INFINILOOM_ERR_INVALID_ARGUMENT, "file info pointer is null");
    }

    return guarded<int32_t>(ctx, "get_file", [&]() -> int32_t {
        if (index >= ctx->files.size()) {
            return fail<int32_t>(ctx, INFINILOOM_ERR_INVALID_ARGUMENT,
                                 "file index " + std::to_string(index) + " out of range");
        }

        const FileRecord& file = ctx->files[index];

        // Counting may throw; nothing is allocated for the caller before it
        uint32_t tokens_claude = fileTokens(ctx, file, TokenizerModel::CLAUDE);
        uint32_t tokens_gpt4o = fileTokens(ctx, file, TokenizerModel::GPT4O);

        char* path = duplicateString(file.path);
        char* relative_path = duplicateString(file.relative_path);
        char* language = file.language.empty() ? nullptr : duplicateString(file.language);
        if (path == nullptr || relative_path == nullptr || (!file.language.empty() && language == nullptr)) {
            std::free(path);
            std::free(relative_path);
            std::free(language);
            return fail<int32_t>(ctx, INFINILOOM_ERR_OUT_OF_MEMORY, "out of memory");
        }

        out->path = path;
        out->path_len = static_cast<uint32_t>(file.path.size());
        out->relative_path = relative_path;
        out->relative_path_len = static_cast<uint32_t>(file.relative_path.size());
        out->size_bytes = file.size;
        out->token_count_claude = tokens_claude;
        out->token_count_gpt4o = tokens_gpt4o;
        out->language = language != nullptr ? language : EMPTY_STRING;
        out->language_len = static_cast<uint8_t>(std::min<size_t>(file.language.size(), 255));
        out->is_binary = file.is_binary ? 1 : 0;
        return INFINILOOM_OK;
    });
}

void infiniloom_free_file_info(infiniloom_file_info* info) {
    if (info == nullptr) {
        return;
    }
    releaseString(info->path);
    releaseString(info->relative_path);
    releaseString(info->language);

    std::memset(info, 0, sizeof(*info));
    info->path = EMPTY_STRING;
    info->relative_path = EMPTY_STRING;
    info->language = EMPTY_STRING;
}

int64_t infiniloom_get_file_content(infiniloom_context* ctx, uint32_t index, char* buffer, uint64_t buffer_size) {
    if (ctx == nullptr) {
        return INFINILOOM_ERR_INVALID_HANDLE;
    }
    ctx->last_error.clear();

    return guarded<int64_t>(ctx, "get_file_content", [&]() -> int64_t {
        if (index >= ctx->files.size()) {
            return fail<int64_t>(ctx, INFINILOOM_ERR_INVALID_ARGUMENT,
                                 "file index " + std::to_string(index) + " out of range");
        }

        const FileRecord& file = ctx->files[index];
        if (!file.content) {
            return fail<int64_t>(ctx, INFINILOOM_ERR_FAILED,
                                 "content of '" + file.relative_path + "' was not loaded; scan with read_contents");
        }

        const std::string& content = *file.content;
        ctx->last_required_size = content.size();
        if (content.size() > buffer_size || (buffer == nullptr && !content.empty())) {
            return fail<int64_t>(ctx, INFINILOOM_ERR_BUFFER_TOO_SMALL,
                                 "buffer too small, need " + std::to_string(content.size()) + " bytes");
        }

        if (!content.empty()) {
            std::memcpy(buffer, content.data(), content.size());
        }
        return static_cast<int64_t>(content.size());
    });
}

int64_t infiniloom_count_tokens(infiniloom_context* ctx, const char* text, size_t text_len, uint8_t model) {
    if (ctx == nullptr) {
        return INFINILOOM_ERR_INVALID_HANDLE;
    }
    ctx->last_error.clear();
    if (text == nullptr && text_len > 0) {
        return fail<int64_t>(ctx, INFINILOOM_ERR_INVALID_ARGUMENT, "text is null");
    }

    return guarded<int64_t>(ctx, "count_tokens", [&]() -> int64_t {
        TokenizerModel tokenizer_model;
        if (!modelFromCode(model, tokenizer_model)) {
            return fail<int64_t>(ctx, INFINILOOM_ERR_INVALID_ARGUMENT, "unknown model code " + std::to_string(model));
        }
        return static_cast<int64_t>(ctx->estimator.estimate(std::string_view(text, text_len), tokenizer_model).count);
    });
}

int32_t infiniloom_count_tokens_all(infiniloom_context* ctx, const char* text, size_t text_len,
                                    infiniloom_token_counts* out) {
    if (ctx == nullptr) {
        return INFINILOOM_ERR_INVALID_HANDLE;
    }
    ctx->last_error.clear();
    if ((text == nullptr && text_len > 0) || out == nullptr) {
        return fail<int32_t>(ctx, INFINILOOM_ERR_INVALID_ARGUMENT, "text or output pointer is null");
    }

    return guarded<int32_t>(ctx, "count_tokens_all", [&]() {
        MultiTokenCount counts = ctx->estimator.estimateAll(std::string_view(text, text_len));
        out->claude = counts.claude;
        out->gpt4o = counts.gpt4o;
        out->gpt4 = counts.gpt4;
        out->gemini = counts.gemini;
        out->llama = counts.llama;
        out->codellama = counts.codellama;
        return INFINILOOM_OK;
    });
}

int32_t infiniloom_load_vocabulary(infiniloom_context* ctx, uint8_t model, const char* path) {
    if (ctx == nullptr) {
        return INFINILOOM_ERR_INVALID_HANDLE;
    }
    ctx->last_error.clear();

    TokenizerModel tokenizer_model;
    if (path == nullptr || !modelFromCode(model, tokenizer_model)) {
        return fail<int32_t>(ctx, INFINILOOM_ERR_INVALID_ARGUMENT, "null path or unknown model code");
    }

    return guarded<int32_t>(ctx, "load_vocabulary", [&]() {
        ctx->estimator.loadVocabulary(tokenizer_model, path);
        ctx->config.vocabularies[tokenizer_model] = path;
        return INFINILOOM_OK;
    });
}

int64_t infiniloom_compress(infiniloom_context* ctx, const char* text, size_t text_len,
                            infiniloom_compression_config config, uint8_t language,
                            char* out_buffer, size_t buffer_size) {
    if (ctx == nullptr) {
        return INFINILOOM_ERR_INVALID_HANDLE;
    }
    ctx->last_error.clear();
    if (text == nullptr && text_len > 0) {
        return fail<int64_t>(ctx, INFINILOOM_ERR_INVALID_ARGUMENT, "text is null");
    }

    return guarded<int64_t>(ctx, "compress", [&]() -> int64_t {
        CompressionLevel level;
        if (!levelFromCode(config.level, level)) {
            return fail<int64_t>(ctx, INFINILOOM_ERR_INVALID_ARGUMENT,
                                 "unknown compression level " + std::to_string(config.level));
        }

        const std::string_view input(text, text_len);
        bool cached = ctx->has_compressed &&
                      ctx->compressed_language == language &&
                      sameConfig(ctx->compressed_config, config) &&
                      std::string_view(ctx->compressed_input) == input;

        if (!cached) {
            CompressionConfig settings = CompressionConfig::forLevel(level);
            settings.strip_line_comments = config.remove_comments != 0;
            settings.strip_block_comments = config.remove_comments != 0;
            settings.collapse_blank_lines = config.remove_empty_lines != 0;
            settings.preserve_imports = config.preserve_imports != 0;

            ctx->has_compressed = false;
            ctx->compressed_input.assign(input.data(), input.size());
            ctx->compressed_output = Compressor(settings).compress(ctx->compressed_input, languageFromCode(language));
            ctx->compressed_config = config;
            ctx->compressed_language = language;
            ctx->has_compressed = true;
        }

        const std::string& output = ctx->compressed_output;
        ctx->last_required_size = output.size();
        if (output.size() > buffer_size || (out_buffer == nullptr && !output.empty())) {
            setError(ctx, "output buffer too small, need " + std::to_string(output.size()) + " bytes");
            return INFINILOOM_ERR_BUFFER_TOO_SMALL;
        }

        if (!output.empty()) {
            std::memcpy(out_buffer, output.data(), output.size());
        }
        return static_cast<int64_t>(output.size());
    });
}

uint64_t infiniloom_last_required_size(infiniloom_context* ctx) {
    return ctx != nullptr ? ctx->last_required_size : 0;
}

uint8_t infiniloom_detect_language(const char* filename) {
    if (filename == nullptr) {
        return LANGUAGE_CODE_UNKNOWN;
    }
    try {
        return languageToCode(Compressor::languageFromFilename(filename));
    } catch (const std::bad_alloc&) {
        return LANGUAGE_CODE_UNKNOWN;
    }
}

uint8_t infiniloom_is_binary(const char* data, size_t len) {
    return ContentClassifier::isBinary(data, len) ? 1 : 0;
}

} // extern "C"
