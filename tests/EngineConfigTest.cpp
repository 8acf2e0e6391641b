// =================================================================
// tests/EngineConfigTest.cpp
// =================================================================
// Unit tests for YAML configuration loading and validation.

#include "Infiniloom/EngineConfig.hpp"
#include "Infiniloom/Errors.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

using Infiniloom::CompressionLevel;
using Infiniloom::ConfigError;
using Infiniloom::EngineConfig;
using Infiniloom::LogLevel;
using Infiniloom::Logger;
using Infiniloom::TokenEstimator;
using Infiniloom::TokenizerModel;

namespace {

const char* const FULL_CONFIG = R"(
scan:
  max_file_size: 1048576
  include_hidden: true
  respect_gitignore: false
  read_contents: true
  use_mmap: false
  mmap_threshold: 4096
  follow_symlinks: true
  parallel: false
  max_threads: 3
  ignore_patterns: ["*.generated.*", "fixtures/"]
  include_extensions: [".py", ".rs"]
  exclude_extensions: [".lock"]
compression:
  level: aggressive
  strip_docstrings: false
  max_consecutive_blank_lines: 2
tokenizer:
  vocabularies:
    gpt-4o: /opt/vocab/o200k_base.tiktoken
    llama: /opt/vocab/tokenizer.json
logging:
  console_level: error
  file_level: info
  console: false
  max_files: 3
)";

// Returns the key of the ConfigError raised by loading text, or "" if none
std::string configErrorKey(const std::string& yaml_text) {
    try {
        EngineConfig::loadFromString(yaml_text);
    } catch (const ConfigError& e) {
        return e.getKey();
    }
    return "";
}

} // namespace

class EngineConfigTest {
private:
    fs::path test_dir;

public:
    EngineConfigTest()
        : test_dir(fs::temp_directory_path() / ("infiniloom_config_" + std::to_string(::getpid()))) {
        fs::create_directories(test_dir);
    }

    ~EngineConfigTest() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void testDefaults() {
        std::cout << "Testing default configuration..." << std::endl;

        EngineConfig config = EngineConfig::loadFromFile((test_dir / "missing.yml").string());
        assert(config.parallel);
        assert(config.scan.respect_gitignore);
        assert(!config.scan.include_hidden);
        assert(config.scan.max_threads == 8);
        assert(config.compression.level == CompressionLevel::BALANCED);
        assert(config.vocabularies.empty());
        assert(config.logging.console_level == LogLevel::WARNING);
        assert(config.validate().empty() && "Defaults raise no problems");

        EngineConfig empty = EngineConfig::loadFromString("");
        assert(empty.scan.max_file_size == config.scan.max_file_size);

        std::cout << "✓ Default configuration test passed" << std::endl;
    }

    void testFullDocument() {
        std::cout << "Testing full configuration document..." << std::endl;

        EngineConfig config = EngineConfig::loadFromString(FULL_CONFIG);

        assert(config.scan.max_file_size == 1048576);
        assert(config.scan.include_hidden);
        assert(!config.scan.respect_gitignore);
        assert(config.scan.read_contents);
        assert(!config.scan.use_mmap);
        assert(config.scan.mmap_threshold == 4096);
        assert(config.scan.follow_symlinks);
        assert(!config.parallel);
        assert(config.scan.max_threads == 3);
        assert(config.scan.ignore_patterns.size() == 2);
        assert(config.scan.ignore_patterns[1] == "fixtures/");
        assert((config.scan.include_extensions == std::vector<std::string>{".py", ".rs"}));
        assert((config.scan.exclude_extensions == std::vector<std::string>{".lock"}));

        // The level sets its toggles, explicit keys override them
        assert(config.compression.level == CompressionLevel::AGGRESSIVE);
        assert(config.compression.normalize_whitespace);
        assert(!config.compression.strip_docstrings);
        assert(config.compression.max_consecutive_blank_lines == 2);

        assert(config.vocabularies.size() == 2);
        assert(config.vocabularies.at(TokenizerModel::GPT4O) == "/opt/vocab/o200k_base.tiktoken");
        assert(config.vocabularies.at(TokenizerModel::LLAMA) == "/opt/vocab/tokenizer.json");

        assert(config.logging.console_level == LogLevel::ERROR);
        assert(config.logging.file_level == LogLevel::INFO);
        assert(!config.logging.console);
        assert(config.logging.max_files == 3);
        assert(config.logging.log_dir.empty());

        std::cout << "✓ Full configuration document test passed" << std::endl;
    }

    void testInvalidValues() {
        std::cout << "Testing invalid configuration values..." << std::endl;

        assert(configErrorKey("scan:\n  max_threads: lots\n") == "scan.max_threads");
        assert(configErrorKey("scan:\n  include_hidden: maybe\n") == "scan.include_hidden");
        assert(configErrorKey("scan:\n  ignore_patterns: \"*.tmp\"\n") == "scan.ignore_patterns");
        assert(configErrorKey("scan: [1, 2]\n") == "scan");
        assert(configErrorKey("compression:\n  level: maximum\n") == "compression.level");
        assert(configErrorKey("tokenizer:\n  vocabularies:\n    bert: /tmp/v.json\n") ==
               "tokenizer.vocabularies.bert");
        assert(configErrorKey("tokenizer:\n  vocabularies:\n    claude: [a, b]\n") ==
               "tokenizer.vocabularies.claude");
        assert(configErrorKey("logging:\n  console_level: loud\n") == "logging.console_level");
        assert(configErrorKey("scan: [1, 2") == "(root)");
        assert(configErrorKey("just a string") == "(root)");

        // Unknown sections are reported but do not fail the load
        assert(configErrorKey("extras:\n  anything: 1\n").empty());

        std::cout << "✓ Invalid configuration values test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing configuration files..." << std::endl;

        fs::path good = test_dir / "infiniloom.yml";
        std::ofstream(good) << FULL_CONFIG;
        EngineConfig config = EngineConfig::loadFromFile(good.string());
        assert(config.scan.max_threads == 3);

        fs::path bad = test_dir / "broken.yml";
        std::ofstream(bad) << "scan:\n  max_threads: [1\n";
        bool threw = false;
        try {
            EngineConfig::loadFromFile(bad.string());
        } catch (const ConfigError& e) {
            threw = true;
            assert(e.getKey() == bad.string() && "Parse errors name the file");
        }
        assert(threw);

        std::cout << "✓ Configuration files test passed" << std::endl;
    }

    void testValidate() {
        std::cout << "Testing configuration validation..." << std::endl;

        EngineConfig config;
        config.scan.max_file_size = 0;
        config.scan.max_threads = 0;
        config.scan.include_extensions = {"py", ".lock"};
        config.vocabularies[TokenizerModel::GEMINI] = (test_dir / "absent.json").string();
        config.logging.max_files = 0;

        // Zero size limit, zero threads, mmap threshold above the limit,
        // "py" without a dot, ".lock" included and excluded, the missing
        // vocabulary and zero log files
        auto problems = config.validate();
        assert(problems.size() == 7);

        config.scan.use_mmap = false;
        assert(config.validate().size() == 6);

        std::cout << "✓ Configuration validation test passed" << std::endl;
    }

    void testApplyVocabularies() {
        std::cout << "Testing vocabulary application..." << std::endl;

        fs::path vocab = test_dir / "ranks.tiktoken";
        std::ofstream(vocab) << "YQ== 0\nYg== 1\nYWI= 2\n";

        EngineConfig config = EngineConfig::loadFromString(
            "tokenizer:\n  vocabularies:\n    claude: " + vocab.string() + "\n");
        assert(config.validate().empty());

        TokenEstimator estimator;
        config.applyVocabularies(estimator);
        assert(estimator.hasVocabulary(TokenizerModel::CLAUDE));
        assert(estimator.estimate("abab", TokenizerModel::CLAUDE).count == 2);

        config.vocabularies[TokenizerModel::GPT4] = (test_dir / "absent.tiktoken").string();
        bool threw = false;
        try {
            config.applyVocabularies(estimator);
        } catch (const Infiniloom::VocabularyError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ Vocabulary application test passed" << std::endl;
    }

    void testApplyLogging() {
        std::cout << "Testing logging application..." << std::endl;

        fs::path log_dir = test_dir / "logs";
        EngineConfig config = EngineConfig::loadFromString(
            "logging:\n  console_level: error\n  log_dir: " + log_dir.string() + "\n");
        config.applyLogging();

        Logger& logger = Logger::getInstance();
        assert(logger.getConsoleLogLevel() == LogLevel::ERROR);
        assert(logger.isFileLoggingEnabled());
        assert(fs::is_directory(log_dir));

        logger.shutdown();
        logger.setConsoleLogLevel(LogLevel::WARNING);
        assert(!logger.isFileLoggingEnabled());

        std::cout << "✓ Logging application test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running EngineConfig unit tests..." << std::endl;

        testDefaults();
        testFullDocument();
        testInvalidValues();
        testLoadFromFile();
        testValidate();
        testApplyVocabularies();
        testApplyLogging();

        std::cout << "All EngineConfig tests passed!" << std::endl;
    }
};

int main() {
    try {
        EngineConfigTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
