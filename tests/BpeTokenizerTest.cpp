// =================================================================
// tests/BpeTokenizerTest.cpp
// =================================================================
// Unit tests for vocabulary loading and byte-pair encoding.

#include "Infiniloom/BpeTokenizer.hpp"
#include "Infiniloom/Errors.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

using Infiniloom::BpeTokenizer;
using Infiniloom::VocabularyError;

namespace {

// a=0 b=1 c=2 ab=3 abc=4 " "=5
const char* const RANK_FILE =
    "YQ== 0\n"
    "Yg== 1\n"
    "Yw== 2\n"
    "YWI= 3\n"
    "YWJj 4\n"
    "IA== 5\n";

const char* const BYTE_LEVEL_JSON = R"({
  "version": "1.0",
  "pre_tokenizer": {"type": "Sequence", "pretokenizers": [{"type": "ByteLevel", "add_prefix_space": false}]},
  "model": {
    "type": "BPE",
    "vocab": {"a": 0, "b": 1, "c": 2, "ab": 3, "abc": 4, "Ġ": 5, "Ġab": 6},
    "merges": ["a b", "ab c", "Ġ ab"]
  }
})";

const char* const SENTENCE_PIECE_JSON = R"({
  "model": {
    "type": "BPE",
    "vocab": {"h": 0, "i": 1, "▁": 2, "hi": 3, "▁hi": 4, "<0x0A>": 5},
    "merges": [["h", "i"], ["▁", "hi"], ["x", "y"]]
  }
})";

bool throwsVocabularyError(void (*loader)()) {
    try {
        loader();
    } catch (const VocabularyError&) {
        return true;
    }
    return false;
}

} // namespace

class BpeTokenizerTest {
public:
    void testBase64() {
        std::cout << "Testing base64 decoding..." << std::endl;

        std::string decoded;
        assert(BpeTokenizer::decodeBase64("aGVsbG8=", decoded));
        assert(decoded == "hello");
        assert(BpeTokenizer::decodeBase64("YWJj", decoded));
        assert(decoded == "abc");
        assert(BpeTokenizer::decodeBase64("IA==", decoded));
        assert(decoded == " ");
        assert(!BpeTokenizer::decodeBase64("a*b=", decoded));
        assert(!BpeTokenizer::decodeBase64("YQ=x", decoded) && "Data after padding");

        std::cout << "✓ Base64 decoding test passed" << std::endl;
    }

    void testChunkSplitting() {
        std::cout << "Testing chunk splitting..." << std::endl;

        auto chunks = BpeTokenizer::splitChunks("don't stop 42\n\nx+y");
        std::vector<std::string> expected = {"don't", " stop", " ", "42", "\n\n", "x", "+", "y"};
        assert(chunks.size() == expected.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            assert(chunks[i] == expected[i]);
        }

        assert(BpeTokenizer::splitChunks("").empty());

        std::cout << "✓ Chunk splitting test passed" << std::endl;
    }

    void testRankFileEncoding() {
        std::cout << "Testing rank file encoding..." << std::endl;

        BpeTokenizer tokenizer = BpeTokenizer::fromTiktoken(RANK_FILE);
        assert(tokenizer.vocabularySize() == 6);
        assert(tokenizer.mergeCount() == 0);

        // a+b -> ab (rank 3), then ab+c -> abc (rank 4)
        auto tokens = tokenizer.encode("abc");
        assert(tokens.size() == 1 && tokens[0] == 4);

        tokens = tokenizer.encode("ab ab");
        assert((tokens == std::vector<uint32_t>{3, 5, 3}));

        // Bytes outside the vocabulary still count as one token each
        assert(tokenizer.countTokens("zz") == 2);
        assert(tokenizer.countTokens("") == 0);

        std::cout << "✓ Rank file encoding test passed" << std::endl;
    }

    void testImplicitRanks() {
        std::cout << "Testing rank files without explicit ranks..." << std::endl;

        BpeTokenizer tokenizer = BpeTokenizer::fromTiktoken("YQ==\r\nYg==\r\n\r\nYWI=\r\n");
        assert(tokenizer.vocabularySize() == 3);
        auto tokens = tokenizer.encode("ab");
        assert(tokens.size() == 1 && tokens[0] == 2);

        std::cout << "✓ Rank files without explicit ranks test passed" << std::endl;
    }

    void testMalformedRankFiles() {
        std::cout << "Testing malformed rank files..." << std::endl;

        assert(throwsVocabularyError([] { BpeTokenizer::fromTiktoken("!!!! 1\n"); }));
        assert(throwsVocabularyError([] { BpeTokenizer::fromTiktoken("YQ== one\n"); }));
        assert(throwsVocabularyError([] { BpeTokenizer::fromTiktoken("YQ== 99999999999\n"); }));
        assert(throwsVocabularyError([] { BpeTokenizer::fromTiktoken("\n\n"); }));

        std::cout << "✓ Malformed rank files test passed" << std::endl;
    }

    void testByteLevelJson() {
        std::cout << "Testing byte-level tokenizer.json..." << std::endl;

        BpeTokenizer tokenizer = BpeTokenizer::fromHuggingFace(BYTE_LEVEL_JSON);
        assert(tokenizer.vocabularySize() == 7);
        assert(tokenizer.mergeCount() == 3);

        auto tokens = tokenizer.encode("abc");
        assert(tokens.size() == 1 && tokens[0] == 4);

        // The space token is stored as U+0120 and merges with the next word
        tokens = tokenizer.encode(" ab");
        assert(tokens.size() == 1 && tokens[0] == 6);

        // "ca" has no merge rule
        assert(tokenizer.countTokens("ca") == 2);

        std::cout << "✓ Byte-level tokenizer.json test passed" << std::endl;
    }

    void testSentencePieceJson() {
        std::cout << "Testing SentencePiece tokenizer.json..." << std::endl;

        BpeTokenizer tokenizer = BpeTokenizer::fromHuggingFace(SENTENCE_PIECE_JSON);
        assert(tokenizer.mergeCount() == 2 && "Merges with unknown tokens are skipped");

        auto tokens = tokenizer.encode("hi");
        assert(tokens.size() == 1 && tokens[0] == 3);

        tokens = tokenizer.encode(" hi");
        assert(tokens.size() == 1 && tokens[0] == 4);

        tokens = tokenizer.encode("\n");
        assert(tokens.size() == 1 && tokens[0] == 5 && "Byte fallback tokens decode to raw bytes");

        std::cout << "✓ SentencePiece tokenizer.json test passed" << std::endl;
    }

    void testMalformedJson() {
        std::cout << "Testing malformed tokenizer.json..." << std::endl;

        assert(throwsVocabularyError([] { BpeTokenizer::fromHuggingFace("{not json"); }));
        assert(throwsVocabularyError([] { BpeTokenizer::fromHuggingFace(R"({"model": {}})"); }));
        assert(throwsVocabularyError([] { BpeTokenizer::fromHuggingFace(R"({"vocab": {"a": 0}})"); }));
        assert(throwsVocabularyError([] { BpeTokenizer::fromHuggingFace(R"({"model": {"vocab": {"a": "x"}}})"); }));
        assert(throwsVocabularyError([] { BpeTokenizer::fromHuggingFace(R"({"model": {"vocab": {}}})"); }));

        std::cout << "✓ Malformed tokenizer.json test passed" << std::endl;
    }

    void testFromFile() {
        std::cout << "Testing vocabulary files..." << std::endl;

        fs::path dir = fs::temp_directory_path() / ("infiniloom_bpe_" + std::to_string(::getpid()));
        fs::create_directories(dir);
        std::ofstream(dir / "ranks.tiktoken") << RANK_FILE;
        std::ofstream(dir / "tokenizer.json") << BYTE_LEVEL_JSON;

        BpeTokenizer ranks = BpeTokenizer::fromFile((dir / "ranks.tiktoken").string());
        assert(ranks.vocabularySize() == 6);

        BpeTokenizer json = BpeTokenizer::fromFile((dir / "tokenizer.json").string());
        assert(json.mergeCount() == 3);

        bool threw = false;
        try {
            BpeTokenizer::fromFile((dir / "missing.tiktoken").string());
        } catch (const VocabularyError&) {
            threw = true;
        }
        assert(threw);

        fs::remove_all(dir);
        std::cout << "✓ Vocabulary files test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running BpeTokenizer unit tests..." << std::endl;

        testBase64();
        testChunkSplitting();
        testRankFileEncoding();
        testImplicitRanks();
        testMalformedRankFiles();
        testByteLevelJson();
        testSentencePieceJson();
        testMalformedJson();
        testFromFile();

        std::cout << "All BpeTokenizer tests passed!" << std::endl;
    }
};

int main() {
    try {
        BpeTokenizerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
