// =================================================================
// src/Infiniloom/EngineConfig.cpp
// =================================================================
// Implementation for loading and checking the engine configuration.

#include "Infiniloom/EngineConfig.hpp"
#include "Infiniloom/Errors.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace Infiniloom {

namespace {

const std::set<std::string> KNOWN_SECTIONS = {"scan", "compression", "tokenizer", "logging"};

void requireMap(const YAML::Node& node, const std::string& key) {
    if (!node.IsMap()) {
        throw ConfigError(key, "expected a mapping");
    }
}

template <typename T>
void readValue(const YAML::Node& section, const std::string& section_name,
               const char* field, const char* expected, T& out) {
    const YAML::Node node = section[field];
    if (!node) {
        return;
    }
    try {
        out = node.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError(section_name + "." + field, std::string("expected ") + expected);
    }
}

void readList(const YAML::Node& section, const std::string& section_name,
              const char* field, std::vector<std::string>& out) {
    const YAML::Node node = section[field];
    if (!node) {
        return;
    }
    if (!node.IsSequence()) {
        throw ConfigError(section_name + "." + field, "expected a list of strings");
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw ConfigError(section_name + "." + field, "expected a list of strings");
        }
        values.push_back(item.as<std::string>());
    }
    out = std::move(values);
}

void readLevel(const YAML::Node& section, const char* field, LogLevel& out) {
    std::string name;
    readValue(section, "logging", field, "a log level name", name);
    if (name.empty()) {
        return;
    }
    if (!Logger::parseLevel(name, out)) {
        throw ConfigError(std::string("logging.") + field, "unknown log level '" + name + "'");
    }
}

void loadScan(const YAML::Node& node, EngineConfig& config) {
    requireMap(node, "scan");
    WalkConfiguration& scan = config.scan;
    readValue(node, "scan", "max_file_size", "a byte count", scan.max_file_size);
    readValue(node, "scan", "include_hidden", "true or false", scan.include_hidden);
    readValue(node, "scan", "respect_gitignore", "true or false", scan.respect_gitignore);
    readValue(node, "scan", "read_contents", "true or false", scan.read_contents);
    readValue(node, "scan", "use_mmap", "true or false", scan.use_mmap);
    readValue(node, "scan", "mmap_threshold", "a byte count", scan.mmap_threshold);
    readValue(node, "scan", "follow_symlinks", "true or false", scan.follow_symlinks);
    readValue(node, "scan", "parallel", "true or false", config.parallel);
    readValue(node, "scan", "max_threads", "a thread count", scan.max_threads);
    readList(node, "scan", "ignore_patterns", scan.ignore_patterns);
    readList(node, "scan", "include_extensions", scan.include_extensions);
    readList(node, "scan", "exclude_extensions", scan.exclude_extensions);
}

void loadCompression(const YAML::Node& node, EngineConfig& config) {
    requireMap(node, "compression");

    std::string level_name;
    readValue(node, "compression", "level", "a compression level name", level_name);
    if (!level_name.empty()) {
        CompressionLevel level;
        if (!Compressor::parseLevel(level_name, level)) {
            throw ConfigError("compression.level", "unknown level '" + level_name + "'");
        }
        config.compression = CompressionConfig::forLevel(level);
    }

    CompressionConfig& compression = config.compression;
    readValue(node, "compression", "strip_line_comments", "true or false", compression.strip_line_comments);
    readValue(node, "compression", "strip_block_comments", "true or false", compression.strip_block_comments);
    readValue(node, "compression", "strip_docstrings", "true or false", compression.strip_docstrings);
    readValue(node, "compression", "collapse_blank_lines", "true or false", compression.collapse_blank_lines);
    readValue(node, "compression", "normalize_whitespace", "true or false", compression.normalize_whitespace);
    readValue(node, "compression", "trim_trailing_whitespace", "true or false",
              compression.trim_trailing_whitespace);
    readValue(node, "compression", "preserve_imports", "true or false", compression.preserve_imports);
    readValue(node, "compression", "preserve_signatures", "true or false", compression.preserve_signatures);
    readValue(node, "compression", "max_consecutive_blank_lines", "a line count",
              compression.max_consecutive_blank_lines);
}

void loadTokenizer(const YAML::Node& node, EngineConfig& config) {
    requireMap(node, "tokenizer");

    const YAML::Node vocabularies = node["vocabularies"];
    if (!vocabularies) {
        return;
    }
    requireMap(vocabularies, "tokenizer.vocabularies");

    for (const auto& entry : vocabularies) {
        const std::string name = entry.first.as<std::string>();
        const std::string key = "tokenizer.vocabularies." + name;

        TokenizerModel model;
        if (!TokenEstimator::parseModel(name, model)) {
            throw ConfigError(key, "unknown model");
        }
        if (!entry.second.IsScalar()) {
            throw ConfigError(key, "expected a file path");
        }
        config.vocabularies[model] = entry.second.as<std::string>();
    }
}

void loadLogging(const YAML::Node& node, EngineConfig& config) {
    requireMap(node, "logging");
    LoggingSettings& logging = config.logging;
    readLevel(node, "console_level", logging.console_level);
    readLevel(node, "file_level", logging.file_level);
    readValue(node, "logging", "console", "true or false", logging.console);
    readValue(node, "logging", "log_dir", "a directory path", logging.log_dir);
    readValue(node, "logging", "max_file_size", "a byte count", logging.max_file_size);
    readValue(node, "logging", "max_files", "a file count", logging.max_files);
}

EngineConfig fromRoot(const YAML::Node& root) {
    EngineConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    requireMap(root, "(root)");

    for (const auto& entry : root) {
        const std::string section = entry.first.as<std::string>();
        if (KNOWN_SECTIONS.count(section) == 0) {
            Logger::getInstance().warning("EngineConfig", "Ignoring unknown section '" + section + "'");
        }
    }

    if (root["scan"]) {
        loadScan(root["scan"], config);
    }
    if (root["compression"]) {
        loadCompression(root["compression"], config);
    }
    if (root["tokenizer"]) {
        loadTokenizer(root["tokenizer"], config);
    }
    if (root["logging"]) {
        loadLogging(root["logging"], config);
    }
    return config;
}

} // namespace

EngineConfig EngineConfig::loadFromFile(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        Logger::getInstance().debug("EngineConfig", "No configuration file, using defaults", path);
        return EngineConfig();
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path, e.what());
    }

    EngineConfig config = fromRoot(root);
    Logger::getInstance().info("EngineConfig", "Loaded configuration", path);
    return config;
}

EngineConfig EngineConfig::loadFromString(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError("(root)", e.what());
    }
    return fromRoot(root);
}

std::vector<std::string> EngineConfig::validate() const {
    std::vector<std::string> problems;

    if (scan.max_file_size == 0) {
        problems.push_back("scan.max_file_size is 0, every non-empty file will be skipped");
    }
    if (scan.max_threads == 0) {
        problems.push_back("scan.max_threads is 0, the parallel scanner will use one thread");
    }
    if (scan.use_mmap && scan.mmap_threshold > scan.max_file_size) {
        problems.push_back("scan.mmap_threshold exceeds scan.max_file_size, files will never be mapped");
    }

    auto checkExtensions = [&problems](const std::vector<std::string>& list, const std::string& key) {
        for (const auto& ext : list) {
            if (ext.empty() || ext[0] != '.') {
                problems.push_back(key + " entry '" + ext + "' does not start with '.' and never matches");
            }
        }
    };
    checkExtensions(scan.include_extensions, "scan.include_extensions");
    checkExtensions(scan.exclude_extensions, "scan.exclude_extensions");

    for (const auto& ext : scan.include_extensions) {
        if (std::find(scan.exclude_extensions.begin(), scan.exclude_extensions.end(), ext) !=
            scan.exclude_extensions.end()) {
            problems.push_back("extension '" + ext + "' is both included and excluded; exclusion wins");
        }
    }

    for (const auto& entry : vocabularies) {
        std::error_code ec;
        if (!fs::is_regular_file(entry.second, ec)) {
            problems.push_back("vocabulary for " + TokenEstimator::modelName(entry.first) +
                               " not found: " + entry.second);
        }
    }

    if (logging.max_files == 0) {
        problems.push_back("logging.max_files is 0, rotation will delete every log file");
    }

    for (const auto& problem : problems) {
        Logger::getInstance().warning("EngineConfig", problem);
    }
    return problems;
}

void EngineConfig::applyLogging() const {
    Logger& logger = Logger::getInstance();
    logger.setConsoleLogging(logging.console);
    logger.setConsoleLogLevel(logging.console_level);
    logger.setFileLogLevel(logging.file_level);
    if (!logging.log_dir.empty()) {
        logger.initialize(logging.log_dir, logging.max_file_size, logging.max_files);
    }
}

void EngineConfig::applyVocabularies(TokenEstimator& estimator) const {
    for (const auto& entry : vocabularies) {
        estimator.loadVocabulary(entry.first, entry.second);
    }
}

} // namespace Infiniloom
