// =================================================================
// include/Infiniloom/BpeTokenizer.hpp
// =================================================================
// Header for byte-pair encoding against a loaded vocabulary.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Infiniloom {

/**
 * @brief Byte-pair encoder driven by a vocabulary and merge ranks
 *
 * Text is pre-split into chunks by character class, each chunk starts
 * as one token per byte, and adjacent tokens are merged lowest rank
 * first until no known pair remains. A merged token takes the id that
 * the concatenated bytes have in the vocabulary, so later merges keep
 * working against the full table.
 *
 * Without explicit merges (tiktoken rank files) the rank of a pair is
 * the vocabulary rank of its concatenation.
 */
class BpeTokenizer {
public:
    BpeTokenizer() = default;

    /**
     * @brief Parse a tiktoken rank file ("<base64 token> <rank>" per line)
     * @throws VocabularyError on malformed lines or an empty table
     */
    static BpeTokenizer fromTiktoken(const std::string& text);

    /**
     * @brief Parse a Hugging Face tokenizer.json document
     *
     * Reads model.vocab and model.merges. Merges may be "a b" strings or
     * ["a", "b"] pairs. Token strings are decoded through the byte-level
     * alphabet when the tokenizer declares a ByteLevel pre-tokenizer or
     * decoder, otherwise as UTF-8 with U+2581 standing for a space.
     *
     * @throws VocabularyError on invalid JSON or a missing vocabulary
     */
    static BpeTokenizer fromHuggingFace(const std::string& json_text);

    /**
     * @brief Load a vocabulary file, choosing the format by extension
     *        (".json" is Hugging Face, anything else tiktoken)
     * @throws VocabularyError if the file cannot be read or parsed
     */
    static BpeTokenizer fromFile(const std::string& path);

    /**
     * @brief Add or replace a vocabulary entry
     * @param bytes Raw token bytes
     * @param id Token id, which is also its rank
     */
    void addToken(const std::string& bytes, uint32_t id);

    /**
     * @brief Append an explicit merge rule; rules added first rank lowest
     * @return false if either side is not in the vocabulary
     */
    bool addMerge(const std::string& first, const std::string& second);

    /**
     * @brief Encode text into token ids
     *
     * Bytes missing from the vocabulary keep a placeholder id above
     * 0xFFFFFF00 and count as one token each.
     */
    std::vector<uint32_t> encode(std::string_view text) const;

    /**
     * @brief Count the tokens encode() would produce
     */
    uint32_t countTokens(std::string_view text) const;

    size_t vocabularySize() const { return m_vocab.size(); }
    size_t mergeCount() const { return m_merge_ranks.size(); }
    bool empty() const { return m_vocab.empty(); }

    /**
     * @brief Split text into pre-tokenization chunks
     *
     * Letters (with apostrophes between letters), digit runs, one
     * whitespace character followed by any letters, newline runs, and
     * every other byte on its own.
     */
    static std::vector<std::string_view> splitChunks(std::string_view text);

    /**
     * @brief Decode standard base64
     * @param encoded Base64 text, padding optional
     * @param decoded Receives the bytes
     * @return false on invalid input
     */
    static bool decodeBase64(std::string_view encoded, std::string& decoded);

private:
    struct Piece {
        std::string bytes;
        uint32_t id;
        bool known;
    };

    std::unordered_map<std::string, uint32_t> m_vocab;
    std::unordered_map<uint64_t, uint32_t> m_merge_ranks;

    static uint64_t pairKey(uint32_t first, uint32_t second) {
        return (static_cast<uint64_t>(first) << 32) | second;
    }

    void encodeChunk(std::string_view chunk, std::vector<uint32_t>& out) const;
    bool pairRank(const Piece& first, const Piece& second, uint32_t& rank, uint32_t& merged_id) const;
};

} // namespace Infiniloom
