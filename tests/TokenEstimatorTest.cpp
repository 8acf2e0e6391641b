// =================================================================
// tests/TokenEstimatorTest.cpp
// =================================================================
// Unit tests for heuristic and vocabulary-backed token counting.

#include "Infiniloom/Errors.hpp"
#include "Infiniloom/TokenEstimator.hpp"
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using Infiniloom::BpeTokenizer;
using Infiniloom::MultiTokenCount;
using Infiniloom::TokenEstimator;
using Infiniloom::TokenizerModel;

class TokenEstimatorTest {
public:
    void testEmptyAndMinimum() {
        std::cout << "Testing empty and minimal input..." << std::endl;

        TokenEstimator estimator;
        for (TokenizerModel model : TokenEstimator::allModels()) {
            assert(estimator.estimate("", model).count == 0);
            assert(estimator.estimate("a", model).count == 1);
            assert(estimator.estimate(" ", model).count == 1 && "Non-empty text is at least one token");
        }
        assert(TokenEstimator::quickEstimate("", TokenizerModel::CLAUDE) == 0);

        std::cout << "✓ Empty and minimal input test passed" << std::endl;
    }

    void testCharacterClasses() {
        std::cout << "Testing character class heuristics..." << std::endl;

        // if(1) sp(0.5) ((1) x(1) sp(0.5) ==(1) sp(0.15) y(1) )(1) = 7.15
        for (TokenizerModel model : TokenEstimator::allModels()) {
            assert(TokenEstimator::quickEstimate("if (x == y)", model) == 8);
        }

        assert(TokenEstimator::quickEstimate("\n\n\n\n\n\n", TokenizerModel::CLAUDE) == 3 &&
               "Newline runs are capped");
        assert(TokenEstimator::quickEstimate("12345", TokenizerModel::CLAUDE) == 2);
        assert(TokenEstimator::quickEstimate("12345", TokenizerModel::GPT4O) == 2);

        // Long words divide by the per-model ratio
        const std::string word = "internationalization";
        assert(TokenEstimator::quickEstimate(word, TokenizerModel::CLAUDE) == 5);
        assert(TokenEstimator::quickEstimate(word, TokenizerModel::CODELLAMA) == 6);

        std::cout << "✓ Character class heuristics test passed" << std::endl;
    }

    void testEstimateAll() {
        std::cout << "Testing counts for every model..." << std::endl;

        TokenEstimator estimator;
        const std::string text = "fn main() {\n    println!(\"hello, world\");\n}\n";
        MultiTokenCount counts = estimator.estimateAll(text);

        for (TokenizerModel model : TokenEstimator::allModels()) {
            assert(counts.get(model) > 0);
            assert(counts.get(model) == estimator.estimate(text, model).count);
        }

        MultiTokenCount manual;
        manual.set(TokenizerModel::GEMINI, 42);
        assert(manual.gemini == 42);
        assert(manual.get(TokenizerModel::GEMINI) == 42);
        assert(manual.get(TokenizerModel::LLAMA) == 0);

        std::cout << "✓ Counts for every model test passed" << std::endl;
    }

    void testBudget() {
        std::cout << "Testing token budgets..." << std::endl;

        TokenEstimator estimator;
        const std::string text = "alpha beta gamma delta epsilon zeta eta theta iota kappa";
        uint32_t total = estimator.estimate(text, TokenizerModel::CLAUDE).count;

        assert(!estimator.exceedsBudget(text, TokenizerModel::CLAUDE, total));
        assert(estimator.exceedsBudget(text, TokenizerModel::CLAUDE, total - 1));

        assert(estimator.truncateToFit(text, TokenizerModel::CLAUDE, total) == text &&
               "Text within budget is returned whole");

        std::string_view prefix = estimator.truncateToFit(text, TokenizerModel::CLAUDE, 4);
        assert(prefix.size() < text.size());
        assert(text.compare(0, prefix.size(), prefix) == 0 && "Result is a prefix");
        assert(estimator.estimate(prefix, TokenizerModel::CLAUDE).count <= 4);
        assert(!prefix.empty() && prefix.back() == ' ' && "Cut lands on a word boundary");

        std::cout << "✓ Token budgets test passed" << std::endl;
    }

    void testVocabularyCounts() {
        std::cout << "Testing vocabulary-backed counts..." << std::endl;

        TokenEstimator estimator;
        assert(!estimator.hasVocabulary(TokenizerModel::CLAUDE));
        assert(estimator.estimate("abc", TokenizerModel::CLAUDE).confidence == TokenEstimator::HEURISTIC_CONFIDENCE);

        // a=0 b=1 c=2 ab=3 abc=4
        auto tokenizer = std::make_shared<const BpeTokenizer>(
            BpeTokenizer::fromTiktoken("YQ== 0\nYg== 1\nYw== 2\nYWI= 3\nYWJj 4\n"));
        estimator.setVocabulary(TokenizerModel::CLAUDE, tokenizer);
        assert(estimator.hasVocabulary(TokenizerModel::CLAUDE));
        assert(!estimator.hasVocabulary(TokenizerModel::GPT4O));

        auto exact = estimator.estimate("abcabc", TokenizerModel::CLAUDE);
        assert(exact.count == 2);
        assert(exact.confidence == 1.0f);
        assert(estimator.estimate("abc", TokenizerModel::GPT4O).confidence == TokenEstimator::HEURISTIC_CONFIDENCE);

        estimator.setVocabulary(TokenizerModel::CLAUDE, nullptr);
        assert(!estimator.hasVocabulary(TokenizerModel::CLAUDE));

        bool threw = false;
        try {
            estimator.loadVocabulary(TokenizerModel::LLAMA, "/nonexistent/infiniloom/tokenizer.json");
        } catch (const Infiniloom::VocabularyError&) {
            threw = true;
        }
        assert(threw);
        assert(!estimator.hasVocabulary(TokenizerModel::LLAMA) && "Failed loads leave the model unchanged");

        std::cout << "✓ Vocabulary-backed counts test passed" << std::endl;
    }

    void testModelNames() {
        std::cout << "Testing model names..." << std::endl;

        TokenizerModel model = TokenizerModel::CLAUDE;
        assert(TokenEstimator::parseModel("GPT-4o", model) && model == TokenizerModel::GPT4O);
        assert(TokenEstimator::parseModel("gpt_4", model) && model == TokenizerModel::GPT4);
        assert(TokenEstimator::parseModel("code-llama", model) && model == TokenizerModel::CODELLAMA);
        assert(TokenEstimator::parseModel("Claude", model) && model == TokenizerModel::CLAUDE);
        assert(!TokenEstimator::parseModel("bert", model));
        assert(model == TokenizerModel::CLAUDE && "Unknown names leave the output untouched");

        for (TokenizerModel candidate : TokenEstimator::allModels()) {
            TokenizerModel parsed = TokenizerModel::CLAUDE;
            assert(TokenEstimator::parseModel(TokenEstimator::modelName(candidate), parsed));
            assert(parsed == candidate);
        }

        std::cout << "✓ Model names test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TokenEstimator unit tests..." << std::endl;

        testEmptyAndMinimum();
        testCharacterClasses();
        testEstimateAll();
        testBudget();
        testVocabularyCounts();
        testModelNames();

        std::cout << "All TokenEstimator tests passed!" << std::endl;
    }
};

int main() {
    try {
        TokenEstimatorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
