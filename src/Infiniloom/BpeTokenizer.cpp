// =================================================================
// src/Infiniloom/BpeTokenizer.cpp
// =================================================================
// Implementation for byte-pair encoding against a loaded vocabulary.

#include "Infiniloom/BpeTokenizer.hpp"
#include "Infiniloom/Errors.hpp"
#include "Infiniloom/Logger.hpp"
#include "nlohmann/json.hpp"
#include <cstddef>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace Infiniloom {

namespace {

constexpr uint32_t UNKNOWN_BYTE_BASE = 0xFFFFFF00u;

bool isLetter(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c >= 128;
}

bool isDigit(unsigned char c) {
    return c >= '0' && c <= '9';
}

bool isWhitespace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

int base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

// GPT-2 byte-level alphabet: printable bytes stand for themselves, the
// rest are shifted to code points from U+0100 upwards.
const std::unordered_map<uint32_t, unsigned char>& byteLevelDecoder() {
    static const std::unordered_map<uint32_t, unsigned char> decoder = [] {
        std::unordered_map<uint32_t, unsigned char> table;
        uint32_t shifted = 0;
        for (uint32_t b = 0; b < 256; ++b) {
            bool printable = (b >= '!' && b <= '~') || (b >= 0xA1 && b <= 0xAC) || (b >= 0xAE && b <= 0xFF);
            if (printable) {
                table[b] = static_cast<unsigned char>(b);
            } else {
                table[256 + shifted] = static_cast<unsigned char>(b);
                shifted++;
            }
        }
        return table;
    }();
    return decoder;
}

// Decode one UTF-8 code point starting at text[pos]; advances pos.
uint32_t nextCodePoint(const std::string& text, size_t& pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t length = 1;
    uint32_t code_point = lead;
    if (lead >= 0xF0) {
        length = 4;
        code_point = lead & 0x07;
    } else if (lead >= 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
    } else if (lead >= 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
    }
    if (pos + length > text.size()) {
        pos++;
        return lead;
    }
    for (size_t k = 1; k < length; ++k) {
        code_point = (code_point << 6) | (static_cast<unsigned char>(text[pos + k]) & 0x3F);
    }
    pos += length;
    return code_point;
}

std::string decodeByteLevelToken(const std::string& token) {
    const auto& decoder = byteLevelDecoder();
    std::string bytes;
    size_t pos = 0;
    while (pos < token.size()) {
        size_t start = pos;
        uint32_t code_point = nextCodePoint(token, pos);
        auto it = decoder.find(code_point);
        if (it != decoder.end()) {
            bytes.push_back(static_cast<char>(it->second));
        } else {
            bytes.append(token, start, pos - start);
        }
    }
    return bytes;
}

std::string decodeSentencePieceToken(const std::string& token) {
    // Byte fallback tokens look like <0x0A>
    if (token.size() == 6 && token.compare(0, 3, "<0x") == 0 && token[5] == '>') {
        try {
            return std::string(1, static_cast<char>(std::stoi(token.substr(3, 2), nullptr, 16)));
        } catch (const std::invalid_argument&) {
            return token;
        }
    }

    static const std::string word_boundary = "\xE2\x96\x81";  // U+2581
    std::string bytes;
    size_t pos = 0;
    while (pos < token.size()) {
        if (token.compare(pos, word_boundary.size(), word_boundary) == 0) {
            bytes.push_back(' ');
            pos += word_boundary.size();
        } else {
            bytes.push_back(token[pos++]);
        }
    }
    return bytes;
}

bool declaresByteLevel(const nlohmann::json& node) {
    if (node.is_object()) {
        auto type = node.find("type");
        if (type != node.end() && type->is_string() && type->get<std::string>() == "ByteLevel") {
            return true;
        }
        for (const auto& item : node.items()) {
            if (declaresByteLevel(item.value())) {
                return true;
            }
        }
    } else if (node.is_array()) {
        for (const auto& item : node) {
            if (declaresByteLevel(item)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

BpeTokenizer BpeTokenizer::fromTiktoken(const std::string& text) {
    BpeTokenizer tokenizer;
    std::istringstream stream(text);
    std::string line;
    size_t line_number = 0;
    uint32_t next_rank = 0;

    while (std::getline(stream, line)) {
        line_number++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        size_t space = line.find(' ');
        std::string token;
        if (!decodeBase64(std::string_view(line).substr(0, space), token) || token.empty()) {
            throw VocabularyError("invalid base64 token on line " + std::to_string(line_number));
        }

        uint32_t rank = next_rank;
        if (space != std::string::npos) {
            try {
                unsigned long parsed = std::stoul(line.substr(space + 1));
                if (parsed > std::numeric_limits<uint32_t>::max()) {
                    throw std::out_of_range("rank");
                }
                rank = static_cast<uint32_t>(parsed);
            } catch (const std::logic_error&) {
                throw VocabularyError("invalid rank on line " + std::to_string(line_number));
            }
        }

        tokenizer.addToken(token, rank);
        next_rank = rank + 1;
    }

    if (tokenizer.empty()) {
        throw VocabularyError("rank file contains no tokens");
    }
    return tokenizer;
}

BpeTokenizer BpeTokenizer::fromHuggingFace(const std::string& json_text) {
    BpeTokenizer tokenizer;

    try {
        nlohmann::json document = nlohmann::json::parse(json_text);

        auto model = document.find("model");
        if (model == document.end() || !model->is_object()) {
            throw VocabularyError("tokenizer.json has no model section");
        }
        auto vocab = model->find("vocab");
        if (vocab == model->end() || !vocab->is_object()) {
            throw VocabularyError("tokenizer.json has no model.vocab object");
        }

        bool byte_level = declaresByteLevel(document.value("pre_tokenizer", nlohmann::json())) ||
                          declaresByteLevel(document.value("decoder", nlohmann::json()));
        auto decode = [byte_level](const std::string& token) {
            return byte_level ? decodeByteLevelToken(token) : decodeSentencePieceToken(token);
        };

        for (const auto& entry : vocab->items()) {
            tokenizer.addToken(decode(entry.key()), entry.value().get<uint32_t>());
        }

        auto merges = model->find("merges");
        if (merges != model->end() && merges->is_array()) {
            size_t skipped = 0;
            for (const auto& merge : *merges) {
                std::string first;
                std::string second;
                if (merge.is_string()) {
                    std::string rule = merge.get<std::string>();
                    size_t space = rule.find(' ');
                    if (space == std::string::npos) {
                        skipped++;
                        continue;
                    }
                    first = rule.substr(0, space);
                    second = rule.substr(space + 1);
                } else if (merge.is_array() && merge.size() == 2) {
                    first = merge[0].get<std::string>();
                    second = merge[1].get<std::string>();
                } else {
                    throw VocabularyError("unsupported merge entry " + merge.dump());
                }
                if (!tokenizer.addMerge(decode(first), decode(second))) {
                    skipped++;
                }
            }
            if (skipped > 0) {
                Logger::getInstance().warning("BpeTokenizer", "Skipped merges with unknown tokens",
                                              std::to_string(skipped) + " rules");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw VocabularyError(std::string("invalid tokenizer.json: ") + e.what());
    }

    if (tokenizer.empty()) {
        throw VocabularyError("tokenizer.json vocabulary is empty");
    }
    return tokenizer;
}

BpeTokenizer BpeTokenizer::fromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw VocabularyError("cannot open " + path);
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw VocabularyError("cannot read " + path);
    }

    bool is_json = path.size() >= 5 && path.compare(path.size() - 5, 5, ".json") == 0;
    BpeTokenizer tokenizer = is_json ? fromHuggingFace(content.str()) : fromTiktoken(content.str());

    Logger::getInstance().info("BpeTokenizer", "Loaded vocabulary " + path,
                               std::to_string(tokenizer.vocabularySize()) + " tokens, " +
                               std::to_string(tokenizer.mergeCount()) + " merges");
    return tokenizer;
}

void BpeTokenizer::addToken(const std::string& bytes, uint32_t id) {
    m_vocab[bytes] = id;
}

bool BpeTokenizer::addMerge(const std::string& first, const std::string& second) {
    auto first_it = m_vocab.find(first);
    auto second_it = m_vocab.find(second);
    if (first_it == m_vocab.end() || second_it == m_vocab.end()) {
        return false;
    }
    uint32_t rank = static_cast<uint32_t>(m_merge_ranks.size());
    m_merge_ranks.emplace(pairKey(first_it->second, second_it->second), rank);
    return true;
}

std::vector<uint32_t> BpeTokenizer::encode(std::string_view text) const {
    std::vector<uint32_t> tokens;
    for (std::string_view chunk : splitChunks(text)) {
        encodeChunk(chunk, tokens);
    }
    return tokens;
}

uint32_t BpeTokenizer::countTokens(std::string_view text) const {
    return static_cast<uint32_t>(encode(text).size());
}

std::vector<std::string_view> BpeTokenizer::splitChunks(std::string_view text) {
    std::vector<std::string_view> chunks;
    size_t i = 0;

    while (i < text.size()) {
        size_t start = i;
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (isLetter(c)) {
            while (i < text.size() &&
                   (isLetter(static_cast<unsigned char>(text[i])) ||
                    (text[i] == '\'' && i + 1 < text.size() && isLetter(static_cast<unsigned char>(text[i + 1]))))) {
                i++;
            }
        } else if (isDigit(c)) {
            while (i < text.size() && isDigit(static_cast<unsigned char>(text[i]))) {
                i++;
            }
        } else if (isWhitespace(c)) {
            // " the" is usually one token
            i++;
            while (i < text.size() && isLetter(static_cast<unsigned char>(text[i]))) {
                i++;
            }
        } else if (c == '\n') {
            i++;
            while (i < text.size() && text[i] == '\n') {
                i++;
            }
        } else {
            i++;
        }

        chunks.push_back(text.substr(start, i - start));
    }

    return chunks;
}

bool BpeTokenizer::decodeBase64(std::string_view encoded, std::string& decoded) {
    decoded.clear();
    uint32_t buffer = 0;
    int bits = 0;
    size_t padding = 0;

    for (char c : encoded) {
        if (c == '=') {
            padding++;
            continue;
        }
        if (padding > 0) {
            return false;
        }
        int value = base64Value(c);
        if (value < 0) {
            return false;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    return padding <= 2 && bits < 6;
}

bool BpeTokenizer::pairRank(const Piece& first, const Piece& second, uint32_t& rank, uint32_t& merged_id) const {
    if (!first.known || !second.known) {
        return false;
    }

    if (!m_merge_ranks.empty()) {
        auto merge = m_merge_ranks.find(pairKey(first.id, second.id));
        if (merge == m_merge_ranks.end()) {
            return false;
        }
        auto merged = m_vocab.find(first.bytes + second.bytes);
        if (merged == m_vocab.end()) {
            return false;
        }
        rank = merge->second;
        merged_id = merged->second;
        return true;
    }

    // Rank files: a pair merges if its concatenation is a token
    auto merged = m_vocab.find(first.bytes + second.bytes);
    if (merged == m_vocab.end()) {
        return false;
    }
    rank = merged->second;
    merged_id = merged->second;
    return true;
}

void BpeTokenizer::encodeChunk(std::string_view chunk, std::vector<uint32_t>& out) const {
    std::vector<Piece> pieces;
    pieces.reserve(chunk.size());

    for (char byte : chunk) {
        std::string bytes(1, byte);
        auto it = m_vocab.find(bytes);
        if (it != m_vocab.end()) {
            pieces.push_back(Piece{std::move(bytes), it->second, true});
        } else {
            pieces.push_back(Piece{std::move(bytes), UNKNOWN_BYTE_BASE + static_cast<unsigned char>(byte), false});
        }
    }

    while (pieces.size() > 1) {
        size_t best_index = pieces.size();
        uint32_t best_rank = std::numeric_limits<uint32_t>::max();
        uint32_t best_id = 0;

        for (size_t i = 0; i + 1 < pieces.size(); ++i) {
            uint32_t rank;
            uint32_t merged_id;
            if (pairRank(pieces[i], pieces[i + 1], rank, merged_id) && rank < best_rank) {
                best_rank = rank;
                best_index = i;
                best_id = merged_id;
            }
        }

        if (best_index == pieces.size()) {
            break;
        }

        pieces[best_index].bytes += pieces[best_index + 1].bytes;
        pieces[best_index].id = best_id;
        pieces.erase(pieces.begin() + static_cast<std::ptrdiff_t>(best_index) + 1);
    }

    for (const auto& piece : pieces) {
        out.push_back(piece.id);
    }
}

} // namespace Infiniloom
