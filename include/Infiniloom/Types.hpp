// =================================================================
// include/Infiniloom/Types.hpp
// =================================================================
// Core data types shared by the scanner, the estimator and the
// boundary layer.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Infiniloom {

/**
 * @brief A file accepted by a directory scan
 */
struct FileRecord {
    std::string path;                       ///< Absolute path
    std::string relative_path;              ///< Path from the scan root, '/'-separated
    uint64_t size = 0;                      ///< Size in bytes
    bool is_binary = false;                 ///< Binary classification of the leading bytes
    std::string language;                   ///< Language tag, empty when unknown
    std::string extension;                  ///< Extension including the dot, empty when none
    std::optional<std::string> content;     ///< Loaded only when content loading is enabled
};

/**
 * @brief Aggregate counters for one scan
 */
struct ScanStatistics {
    uint32_t total_files = 0;
    uint64_t total_bytes = 0;
    uint32_t skipped_binary = 0;
    uint32_t skipped_size = 0;
    uint32_t skipped_ignored = 0;
    uint32_t skipped_hidden = 0;
    uint32_t skipped_extension = 0;
    uint32_t skipped_unreadable = 0;
    uint32_t directories_failed = 0;
    int64_t scan_time_ms = 0;
};

/**
 * @brief Extensions skipped by default (binaries, media, archives, lock files)
 */
std::vector<std::string> defaultExcludedExtensions();

/**
 * @brief Options for one directory walk
 */
struct WalkConfiguration {
    uint64_t max_file_size = 50 * 1024 * 1024;   // 50MB
    bool follow_symlinks = false;
    bool include_hidden = false;
    bool respect_gitignore = true;
    bool read_contents = false;
    bool use_mmap = true;
    uint64_t mmap_threshold = 64 * 1024;         // 64KB
    std::vector<std::string> ignore_patterns;
    std::vector<std::string> include_extensions; ///< Empty means every extension
    std::vector<std::string> exclude_extensions = defaultExcludedExtensions();
    size_t max_threads = 8;
};

/**
 * @brief Extract the extension of a file name
 *
 * Recognizes the compound ".min.js" and ".min.css" forms, otherwise
 * returns everything from the last dot of the final path component.
 *
 * @param filename File name or path
 * @return Extension including the dot, or an empty string
 */
std::string getExtension(const std::string& filename);

/**
 * @brief Map a file name to a language tag ("python", "cpp", ...)
 * @param filename File name or path
 * @return Language tag, or an empty string if unknown
 */
std::string detectLanguage(const std::string& filename);

} // namespace Infiniloom
