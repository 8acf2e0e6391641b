// =================================================================
// include/Infiniloom/AbiCodes.hpp
// =================================================================
// Numeric codes shared by the C ABI and the embedding surface.

#pragma once

#include "Infiniloom/Compressor.hpp"
#include "Infiniloom/TokenEstimator.hpp"
#include <cstdint>

namespace Infiniloom {

constexpr uint8_t LANGUAGE_CODE_UNKNOWN = 255;

inline uint8_t languageToCode(Language language) {
    return language == Language::UNKNOWN ? LANGUAGE_CODE_UNKNOWN : static_cast<uint8_t>(language);
}

inline Language languageFromCode(uint8_t code) {
    return code < static_cast<uint8_t>(Language::UNKNOWN) ? static_cast<Language>(code) : Language::UNKNOWN;
}

/**
 * @brief Map a model code to a model
 * @return false if the code is out of range
 */
inline bool modelFromCode(uint8_t code, TokenizerModel& model) {
    if (code >= TOKENIZER_MODEL_COUNT) {
        return false;
    }
    model = static_cast<TokenizerModel>(code);
    return true;
}

/**
 * @brief Map a level code to a level
 * @return false if the code is out of range
 */
inline bool levelFromCode(uint8_t code, CompressionLevel& level) {
    if (code > static_cast<uint8_t>(CompressionLevel::EXTREME)) {
        return false;
    }
    level = static_cast<CompressionLevel>(code);
    return true;
}

} // namespace Infiniloom
