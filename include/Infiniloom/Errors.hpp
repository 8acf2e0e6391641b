// =================================================================
// include/Infiniloom/Errors.hpp
// =================================================================
// Exception types thrown by the core library.

#pragma once

#include <stdexcept>
#include <string>

namespace Infiniloom {

/**
 * @brief Base class for all errors raised by the core library
 */
class InfiniloomError : public std::runtime_error {
public:
    explicit InfiniloomError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The scan root could not be opened or is not a directory
 */
class ScanError : public InfiniloomError {
public:
    ScanError(const std::string& root_path, const std::string& reason)
        : InfiniloomError("Cannot scan '" + root_path + "': " + reason),
          m_root_path(root_path) {}

    const std::string& getRootPath() const { return m_root_path; }

private:
    std::string m_root_path;
};

/**
 * @brief A vocabulary or merge table could not be loaded
 */
class VocabularyError : public InfiniloomError {
public:
    explicit VocabularyError(const std::string& message)
        : InfiniloomError("Vocabulary error: " + message) {}
};

/**
 * @brief A configuration file contains an invalid value
 */
class ConfigError : public InfiniloomError {
public:
    ConfigError(const std::string& key, const std::string& reason)
        : InfiniloomError("Invalid configuration value for '" + key + "': " + reason),
          m_key(key) {}

    const std::string& getKey() const { return m_key; }

private:
    std::string m_key;
};

} // namespace Infiniloom
