// =================================================================
// include/Infiniloom/EngineConfig.hpp
// =================================================================
// Defines the YAML configuration for scanning, compression, token
// counting and logging.

#pragma once

#include "Infiniloom/Compressor.hpp"
#include "Infiniloom/Logger.hpp"
#include "Infiniloom/TokenEstimator.hpp"
#include "Infiniloom/Types.hpp"
#include <map>
#include <string>
#include <vector>

namespace Infiniloom {

/**
 * @brief Logger settings from the "logging" section
 */
struct LoggingSettings {
    LogLevel console_level = LogLevel::WARNING;
    LogLevel file_level = LogLevel::DEBUG;
    bool console = true;
    std::string log_dir;                        ///< Empty disables file logging
    size_t max_file_size = 10 * 1024 * 1024;    // 10MB
    size_t max_files = 5;
};

/**
 * @brief Engine configuration
 *
 * Example file:
 * @code
 * scan:
 *   max_file_size: 1048576
 *   include_hidden: false
 *   respect_gitignore: true
 *   read_contents: true
 *   use_mmap: true
 *   mmap_threshold: 65536
 *   follow_symlinks: false
 *   parallel: true
 *   max_threads: 8
 *   ignore_patterns: ["*.generated.*", "fixtures/"]
 *   include_extensions: [".py", ".rs"]
 *   exclude_extensions: [".lock"]
 * compression:
 *   level: balanced
 *   strip_docstrings: true
 *   max_consecutive_blank_lines: 1
 * tokenizer:
 *   vocabularies:
 *     gpt-4o: /opt/vocab/o200k_base.tiktoken
 *     llama: /opt/vocab/tokenizer.json
 * logging:
 *   console_level: warning
 *   file_level: debug
 *   log_dir: /var/log/infiniloom
 * @endcode
 *
 * Every key is optional. A compression level sets the toggles of that
 * level first; toggles given next to it override them.
 */
struct EngineConfig {
    WalkConfiguration scan;
    bool parallel = true;
    CompressionConfig compression;
    std::map<TokenizerModel, std::string> vocabularies;
    LoggingSettings logging;

    /**
     * @brief Load a configuration file
     * @param path Path to the YAML file
     * @return The loaded configuration, or the defaults if the file does not exist
     * @throws ConfigError if the file is malformed or a value is invalid
     */
    static EngineConfig loadFromFile(const std::string& path);

    /**
     * @brief Load a configuration from YAML text
     * @throws ConfigError if the text is malformed or a value is invalid
     */
    static EngineConfig loadFromString(const std::string& yaml_text);

    /**
     * @brief Check the configuration for values that load but cannot work well
     *
     * Each problem is logged as a warning.
     *
     * @return Descriptions of the problems found, empty if none
     */
    std::vector<std::string> validate() const;

    /**
     * @brief Apply the logging section to the Logger
     */
    void applyLogging() const;

    /**
     * @brief Load every configured vocabulary into an estimator
     * @throws VocabularyError if a vocabulary cannot be loaded
     */
    void applyVocabularies(TokenEstimator& estimator) const;
};

} // namespace Infiniloom
