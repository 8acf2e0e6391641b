// =================================================================
// src/Infiniloom/EmbedApi.cpp
// =================================================================
// Handle-free embedding surface over the estimator and compressor.

#include "Infiniloom/infiniloom_embed.h"
#include "Infiniloom/AbiCodes.hpp"
#include "Infiniloom/ContentClassifier.hpp"
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <new>
#include <string>
#include <string_view>

namespace {

using namespace Infiniloom;

void* defaultAlloc(size_t size) {
    return std::malloc(size);
}

void defaultFree(void* ptr, size_t) {
    std::free(ptr);
}

struct HostAllocator {
    std::mutex mutex;
    infiniloom_embed_alloc_fn alloc_fn = defaultAlloc;
    infiniloom_embed_free_fn free_fn = defaultFree;
};

HostAllocator& hostAllocator() {
    static HostAllocator allocator;
    return allocator;
}

std::string_view textView(const char* text, size_t len) {
    return text != nullptr ? std::string_view(text, len) : std::string_view();
}

/**
 * @brief Compress with a level's defaults
 * @return false if the level code is unknown or compression failed
 */
bool compressText(const char* text, size_t len, uint8_t level_code, uint8_t language, std::string& output) {
    CompressionLevel level;
    if (!levelFromCode(level_code, level) || (text == nullptr && len > 0)) {
        return false;
    }
    try {
        output = Compressor::compress(std::string(textView(text, len)), level, languageFromCode(language));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

extern "C" {

void infiniloom_embed_set_allocator(infiniloom_embed_alloc_fn alloc_fn, infiniloom_embed_free_fn free_fn) {
    HostAllocator& allocator = hostAllocator();
    std::lock_guard<std::mutex> lock(allocator.mutex);
    if (alloc_fn == nullptr || free_fn == nullptr) {
        allocator.alloc_fn = defaultAlloc;
        allocator.free_fn = defaultFree;
    } else {
        allocator.alloc_fn = alloc_fn;
        allocator.free_fn = free_fn;
    }
}

// Host hooks run outside the lock so they may call back into this surface
void* infiniloom_embed_alloc(size_t size) {
    HostAllocator& allocator = hostAllocator();
    infiniloom_embed_alloc_fn alloc_fn;
    {
        std::lock_guard<std::mutex> lock(allocator.mutex);
        alloc_fn = allocator.alloc_fn;
    }
    return alloc_fn(size);
}

void infiniloom_embed_free(void* ptr, size_t size) {
    if (ptr == nullptr) {
        return;
    }
    HostAllocator& allocator = hostAllocator();
    infiniloom_embed_free_fn free_fn;
    {
        std::lock_guard<std::mutex> lock(allocator.mutex);
        free_fn = allocator.free_fn;
    }
    free_fn(ptr, size);
}

uint32_t infiniloom_embed_count_tokens(const char* text, size_t len, uint8_t model) {
    TokenizerModel tokenizer_model;
    if (!modelFromCode(model, tokenizer_model)) {
        return 0;
    }
    return TokenEstimator::quickEstimate(textView(text, len), tokenizer_model);
}

void infiniloom_embed_count_tokens_all(const char* text, size_t len, uint32_t* out) {
    if (out == nullptr) {
        return;
    }
    for (TokenizerModel model : TokenEstimator::allModels()) {
        out[static_cast<size_t>(model)] = TokenEstimator::quickEstimate(textView(text, len), model);
    }
}

int64_t infiniloom_embed_compress(const char* text, size_t len, uint8_t level, uint8_t language,
                                  char* out, size_t out_size) {
    std::string output;
    if (!compressText(text, len, level, language, output)) {
        return INFINILOOM_EMBED_ERR_FAILED;
    }
    if (output.size() > out_size || (out == nullptr && !output.empty())) {
        return INFINILOOM_EMBED_ERR_BUFFER_TOO_SMALL;
    }
    if (!output.empty()) {
        std::memcpy(out, output.data(), output.size());
    }
    return static_cast<int64_t>(output.size());
}

char* infiniloom_embed_compress_alloc(const char* text, size_t len, uint8_t level, uint8_t language,
                                      size_t* out_len) {
    std::string output;
    if (out_len == nullptr || !compressText(text, len, level, language, output)) {
        return nullptr;
    }

    char* buffer = static_cast<char*>(infiniloom_embed_alloc(output.size() + 1));
    if (buffer == nullptr) {
        return nullptr;
    }
    std::memcpy(buffer, output.data(), output.size());
    buffer[output.size()] = '\0';
    *out_len = output.size();
    return buffer;
}

uint8_t infiniloom_embed_detect_language(const char* filename, size_t len) {
    if (filename == nullptr || len == 0) {
        return LANGUAGE_CODE_UNKNOWN;
    }
    try {
        return languageToCode(Compressor::languageFromFilename(std::string(filename, len)));
    } catch (const std::bad_alloc&) {
        return LANGUAGE_CODE_UNKNOWN;
    }
}

uint8_t infiniloom_embed_is_binary(const char* data, size_t len) {
    return ContentClassifier::isBinary(data, len) ? 1 : 0;
}

const char* infiniloom_embed_version(void) {
    return INFINILOOM_VERSION;
}

} // extern "C"
