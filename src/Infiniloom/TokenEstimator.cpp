// =================================================================
// src/Infiniloom/TokenEstimator.cpp
// =================================================================
// Implementation for per-model token counting.

#include "Infiniloom/TokenEstimator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace Infiniloom {

namespace {

bool isLetter(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c >= 128;
}

bool isDigit(unsigned char c) {
    return c >= '0' && c <= '9';
}

bool isDoubleOperator(char c, char next) {
    return (c == '=' && next == '=') ||
           (c == '!' && next == '=') ||
           (c == '<' && next == '=') ||
           (c == '>' && next == '=') ||
           (c == '&' && next == '&') ||
           (c == '|' && next == '|') ||
           (c == '+' && next == '+') ||
           (c == '-' && next == '-') ||
           (c == '-' && next == '>') ||
           (c == '=' && next == '>');
}

// Average letters per token for words longer than three characters
double wordRatio(TokenizerModel model) {
    switch (model) {
        case TokenizerModel::CLAUDE: return 4.2;
        case TokenizerModel::GPT4O: return 4.5;
        case TokenizerModel::GPT4: return 4.0;
        case TokenizerModel::GEMINI: return 4.0;
        case TokenizerModel::LLAMA: return 3.8;
        case TokenizerModel::CODELLAMA: return 3.5;
    }
    return 4.0;
}

double numberRatio(TokenizerModel model) {
    return model == TokenizerModel::GPT4O ? 3.0 : 2.5;
}

size_t modelIndex(TokenizerModel model) {
    return static_cast<size_t>(model);
}

} // namespace

uint32_t MultiTokenCount::get(TokenizerModel model) const {
    switch (model) {
        case TokenizerModel::CLAUDE: return claude;
        case TokenizerModel::GPT4O: return gpt4o;
        case TokenizerModel::GPT4: return gpt4;
        case TokenizerModel::GEMINI: return gemini;
        case TokenizerModel::LLAMA: return llama;
        case TokenizerModel::CODELLAMA: return codellama;
    }
    return 0;
}

void MultiTokenCount::set(TokenizerModel model, uint32_t count) {
    switch (model) {
        case TokenizerModel::CLAUDE: claude = count; break;
        case TokenizerModel::GPT4O: gpt4o = count; break;
        case TokenizerModel::GPT4: gpt4 = count; break;
        case TokenizerModel::GEMINI: gemini = count; break;
        case TokenizerModel::LLAMA: llama = count; break;
        case TokenizerModel::CODELLAMA: codellama = count; break;
    }
}

TokenCount TokenEstimator::estimate(std::string_view text, TokenizerModel model) const {
    if (text.empty()) {
        return TokenCount{model, 0, 1.0f};
    }

    const auto& vocabulary = m_vocabularies[modelIndex(model)];
    if (vocabulary) {
        return TokenCount{model, vocabulary->countTokens(text), 1.0f};
    }

    return TokenCount{model, quickEstimate(text, model), HEURISTIC_CONFIDENCE};
}

MultiTokenCount TokenEstimator::estimateAll(std::string_view text) const {
    MultiTokenCount counts;
    for (TokenizerModel model : allModels()) {
        counts.set(model, estimate(text, model).count);
    }
    return counts;
}

uint32_t TokenEstimator::quickEstimate(std::string_view text, TokenizerModel model) {
    if (text.empty()) {
        return 0;
    }

    const double word_ratio = wordRatio(model);
    const double number_ratio = numberRatio(model);
    double tokens = 0.0;
    size_t i = 0;

    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (isLetter(c)) {
            size_t start = i;
            while (i < text.size() && (isLetter(static_cast<unsigned char>(text[i])) || text[i] == '\'')) {
                i++;
            }
            size_t word_len = i - start;
            // Short words are usually a single token
            tokens += word_len <= 3 ? 1.0 : static_cast<double>(word_len) / word_ratio;
        } else if (isDigit(c)) {
            size_t start = i;
            while (i < text.size() &&
                   (isDigit(static_cast<unsigned char>(text[i])) || text[i] == '.' || text[i] == ',')) {
                i++;
            }
            tokens += static_cast<double>(i - start) / number_ratio;
        } else if (c == ' ') {
            i++;
            // A leading space usually fuses with the next word
            tokens += (i < text.size() && isLetter(static_cast<unsigned char>(text[i]))) ? 0.15 : 0.5;
        } else if (c == '\n') {
            size_t start = i;
            while (i < text.size() && text[i] == '\n') {
                i++;
            }
            tokens += static_cast<double>(std::min<size_t>(i - start, 3));
        } else if (c == '\t') {
            i++;
            tokens += 1.0;
        } else {
            i++;
            if (i < text.size() && isDoubleOperator(static_cast<char>(c), text[i])) {
                i++;
            }
            tokens += 1.0;
        }
    }

    return std::max<uint32_t>(1, static_cast<uint32_t>(std::ceil(tokens)));
}

bool TokenEstimator::exceedsBudget(std::string_view text, TokenizerModel model, uint32_t budget) const {
    return estimate(text, model).count > budget;
}

std::string_view TokenEstimator::truncateToFit(std::string_view text, TokenizerModel model, uint32_t budget) const {
    if (estimate(text, model).count <= budget) {
        return text;
    }

    size_t low = 0;
    size_t high = text.size();
    while (low < high) {
        size_t mid = (low + high + 1) / 2;
        if (estimate(text.substr(0, mid), model).count <= budget) {
            low = mid;
        } else {
            high = mid - 1;
        }
    }

    // Prefer ending on a word boundary
    size_t end = low;
    while (end > 0 && text[end - 1] != ' ' && text[end - 1] != '\n') {
        end--;
    }

    return text.substr(0, end > 0 ? end : low);
}

void TokenEstimator::setVocabulary(TokenizerModel model, std::shared_ptr<const BpeTokenizer> tokenizer) {
    m_vocabularies[modelIndex(model)] = std::move(tokenizer);
}

void TokenEstimator::loadVocabulary(TokenizerModel model, const std::string& path) {
    setVocabulary(model, std::make_shared<const BpeTokenizer>(BpeTokenizer::fromFile(path)));
}

bool TokenEstimator::hasVocabulary(TokenizerModel model) const {
    return m_vocabularies[modelIndex(model)] != nullptr;
}

std::string TokenEstimator::modelName(TokenizerModel model) {
    switch (model) {
        case TokenizerModel::CLAUDE: return "claude";
        case TokenizerModel::GPT4O: return "gpt-4o";
        case TokenizerModel::GPT4: return "gpt-4";
        case TokenizerModel::GEMINI: return "gemini";
        case TokenizerModel::LLAMA: return "llama";
        case TokenizerModel::CODELLAMA: return "codellama";
    }
    return "unknown";
}

bool TokenEstimator::parseModel(const std::string& name, TokenizerModel& model) {
    std::string lower;
    for (char c : name) {
        if (c != '-' && c != '_') {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    for (TokenizerModel candidate : allModels()) {
        std::string candidate_name;
        for (char c : modelName(candidate)) {
            if (c != '-') {
                candidate_name.push_back(c);
            }
        }
        if (lower == candidate_name) {
            model = candidate;
            return true;
        }
    }
    return false;
}

const std::array<TokenizerModel, TOKENIZER_MODEL_COUNT>& TokenEstimator::allModels() {
    static const std::array<TokenizerModel, TOKENIZER_MODEL_COUNT> models = {
        TokenizerModel::CLAUDE,
        TokenizerModel::GPT4O,
        TokenizerModel::GPT4,
        TokenizerModel::GEMINI,
        TokenizerModel::LLAMA,
        TokenizerModel::CODELLAMA
    };
    return models;
}

} // namespace Infiniloom
