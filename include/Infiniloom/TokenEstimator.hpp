// =================================================================
// include/Infiniloom/TokenEstimator.hpp
// =================================================================
// Header for per-model token counting.

#pragma once

#include "Infiniloom/BpeTokenizer.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace Infiniloom {

/**
 * @brief Target model families
 */
enum class TokenizerModel {
    CLAUDE,
    GPT4O,
    GPT4,
    GEMINI,
    LLAMA,
    CODELLAMA
};

constexpr size_t TOKENIZER_MODEL_COUNT = 6;

/**
 * @brief Token count for one model
 */
struct TokenCount {
    TokenizerModel model;
    uint32_t count;
    float confidence;   ///< 1.0 when counted with a vocabulary, 0.95 when estimated
};

/**
 * @brief Token counts for every model
 */
struct MultiTokenCount {
    uint32_t claude = 0;
    uint32_t gpt4o = 0;
    uint32_t gpt4 = 0;
    uint32_t gemini = 0;
    uint32_t llama = 0;
    uint32_t codellama = 0;

    uint32_t get(TokenizerModel model) const;
    void set(TokenizerModel model, uint32_t count);
};

/**
 * @brief Counts tokens per model
 *
 * By default counts are a character-class heuristic: letter runs of up to
 * three characters are one token, longer runs divide by a per-model
 * characters-per-token ratio, digit runs by a digits-per-token ratio,
 * a space before a letter adds 0.15 and any other space 0.5, newline
 * runs add at most 3, and any other byte adds 1 (common two-character
 * operators count once). The total is rounded up and is at least 1 for
 * non-empty text.
 *
 * When a vocabulary is loaded for a model, its counts come from the
 * byte-pair encoder instead and are reported as exact.
 */
class TokenEstimator {
public:
    static constexpr float HEURISTIC_CONFIDENCE = 0.95f;

    TokenEstimator() = default;

    /**
     * @brief Count tokens for one model
     * @param text Input text
     * @param model Target model
     * @return Count with its confidence; zero for empty text
     */
    TokenCount estimate(std::string_view text, TokenizerModel model) const;

    /**
     * @brief Count tokens for every model
     */
    MultiTokenCount estimateAll(std::string_view text) const;

    /**
     * @brief Heuristic count, ignoring any loaded vocabulary
     */
    static uint32_t quickEstimate(std::string_view text, TokenizerModel model);

    /**
     * @brief Check if text is over a token budget
     */
    bool exceedsBudget(std::string_view text, TokenizerModel model, uint32_t budget) const;

    /**
     * @brief Find the longest prefix that fits a token budget
     *
     * Binary-searches the prefix length, then backs off to the last
     * space or newline when one exists.
     *
     * @return A prefix of text
     */
    std::string_view truncateToFit(std::string_view text, TokenizerModel model, uint32_t budget) const;

    /**
     * @brief Use a vocabulary for exact counts for a model
     * @param model Target model
     * @param tokenizer Loaded encoder, nullptr to go back to estimation
     */
    void setVocabulary(TokenizerModel model, std::shared_ptr<const BpeTokenizer> tokenizer);

    /**
     * @brief Load a vocabulary file (tiktoken ranks or tokenizer.json)
     * @throws VocabularyError if the file cannot be loaded
     */
    void loadVocabulary(TokenizerModel model, const std::string& path);

    bool hasVocabulary(TokenizerModel model) const;

    static std::string modelName(TokenizerModel model);

    /**
     * @brief Parse a model name ("claude", "gpt-4o", "gpt4o", ...)
     * @return false if the name is unknown
     */
    static bool parseModel(const std::string& name, TokenizerModel& model);

    static const std::array<TokenizerModel, TOKENIZER_MODEL_COUNT>& allModels();

private:
    std::array<std::shared_ptr<const BpeTokenizer>, TOKENIZER_MODEL_COUNT> m_vocabularies;
};

} // namespace Infiniloom
