// =================================================================
// src/Infiniloom/ScannerBase.cpp
// =================================================================
// Implementation for the shared directory traversal policy.

#include "Infiniloom/ScannerBase.hpp"
#include "Infiniloom/ContentClassifier.hpp"
#include "Infiniloom/Errors.hpp"
#include "Infiniloom/Logger.hpp"
#include "Infiniloom/MappedFile.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace Infiniloom {

void ScanCounters::reset() {
    total_files = 0;
    total_bytes = 0;
    skipped_binary = 0;
    skipped_size = 0;
    skipped_ignored = 0;
    skipped_hidden = 0;
    skipped_extension = 0;
    skipped_unreadable = 0;
    directories_failed = 0;
}

ScanStatistics ScanCounters::snapshot() const {
    ScanStatistics stats;
    stats.total_files = total_files.load();
    stats.total_bytes = total_bytes.load();
    stats.skipped_binary = skipped_binary.load();
    stats.skipped_size = skipped_size.load();
    stats.skipped_ignored = skipped_ignored.load();
    stats.skipped_hidden = skipped_hidden.load();
    stats.skipped_extension = skipped_extension.load();
    stats.skipped_unreadable = skipped_unreadable.load();
    stats.directories_failed = directories_failed.load();
    return stats;
}

ScannerBase::ScannerBase(WalkConfiguration config)
    : m_config(std::move(config)) {}

void ScannerBase::walk(const std::string& root_path) {
    auto start_time = std::chrono::steady_clock::now();

    prepare(root_path);
    traverse();

    m_stats = m_counters.snapshot();
    m_stats.scan_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    Logger::getInstance().logScanSummary(m_root_path, m_stats, isParallel());
}

std::vector<FileRecord> ScannerBase::takeFiles() {
    std::vector<FileRecord> files = std::move(m_files);
    m_files.clear();
    return files;
}

bool ScannerBase::isIgnored(const std::string& relative_path, bool is_directory) const {
    return m_ignore.matches(relative_path, is_directory);
}

void ScannerBase::addRecord(FileRecord record) {
    m_files.push_back(std::move(record));
}

void ScannerBase::prepare(const std::string& root_path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(root_path), ec);
    if (ec) {
        throw ScanError(root_path, ec.message());
    }

    fs::file_status status = fs::status(absolute, ec);
    if (!fs::is_directory(status)) {
        if (fs::exists(status)) {
            throw ScanError(root_path, "not a directory");
        }
        throw ScanError(root_path, ec ? ec.message() : "no such directory");
    }

    std::string normalized = absolute.lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }

    m_root_path = normalized;
    m_files.clear();
    m_stats = ScanStatistics();
    m_counters.reset();

    // Built-in rules, then the root .gitignore, then user rules: later rules win
    m_ignore.clear();
    if (m_config.respect_gitignore) {
        m_ignore.addDefaults();
        m_ignore.loadFromFile(absolutePath(".gitignore"));
    }
    for (const auto& pattern : m_config.ignore_patterns) {
        m_ignore.addPattern(pattern);
    }
}

void ScannerBase::scanDirectory(const std::string& relative_path) {
    std::error_code ec;
    fs::directory_iterator it(absolutePath(relative_path), ec);
    if (ec) {
        if (relative_path.empty()) {
            throw ScanError(m_root_path, ec.message());
        }
        m_counters.directories_failed++;
        INFINILOOM_LOG_DEBUG("Scanner", "Cannot open directory " + relative_path + ": " + ec.message());
        return;
    }

    const fs::directory_iterator end;
    while (it != end) {
        const fs::directory_entry& entry = *it;
        std::string name = entry.path().filename().string();

        if (!name.empty()) {
            std::string entry_path = relative_path.empty() ? name : relative_path + "/" + name;

            if (!m_config.include_hidden && name[0] == '.') {
                m_counters.skipped_hidden++;
            } else {
                std::error_code status_ec;
                fs::file_status link_status = entry.symlink_status(status_ec);
                bool is_directory = false;
                bool is_file = false;

                if (status_ec) {
                    m_counters.skipped_unreadable++;
                } else if (fs::is_symlink(link_status)) {
                    // Symlinked directories are never descended
                    if (m_config.follow_symlinks) {
                        fs::file_status target = entry.status(status_ec);
                        if (status_ec) {
                            m_counters.skipped_unreadable++;
                        } else {
                            is_file = fs::is_regular_file(target);
                        }
                    }
                } else {
                    is_directory = fs::is_directory(link_status);
                    is_file = fs::is_regular_file(link_status);
                }

                if (is_directory || is_file) {
                    if (isIgnored(entry_path, is_directory)) {
                        m_counters.skipped_ignored++;
                    } else if (is_directory) {
                        enqueueDirectory(entry_path);
                    } else {
                        processFile(entry_path, name);
                    }
                }
            }
        }

        it.increment(ec);
        if (ec) {
            m_counters.directories_failed++;
            INFINILOOM_LOG_DEBUG("Scanner", "Listing of " + relative_path + " interrupted: " + ec.message());
            break;
        }
    }
}

void ScannerBase::processFile(const std::string& relative_path, const std::string& name) {
    std::string path = absolutePath(relative_path);

    std::error_code ec;
    uint64_t size = fs::file_size(path, ec);
    if (ec) {
        m_counters.skipped_unreadable++;
        return;
    }

    if (size > m_config.max_file_size) {
        m_counters.skipped_size++;
        return;
    }

    // Files without an extension bypass the extension lists
    std::string extension = getExtension(name);
    if (!extension.empty() && isExtensionExcluded(extension)) {
        m_counters.skipped_extension++;
        return;
    }

    bool is_binary = false;
    if (size > 0 && !readHeaderIsBinary(path, is_binary)) {
        m_counters.skipped_unreadable++;
        return;
    }
    if (is_binary) {
        m_counters.skipped_binary++;
        return;
    }

    FileRecord record;
    record.path = path;
    record.relative_path = relative_path;
    record.size = size;
    record.is_binary = false;
    record.language = detectLanguage(name);
    record.extension = extension;

    if (m_config.read_contents) {
        try {
            SmartReader reader(m_config.mmap_threshold, m_config.use_mmap);
            record.content = reader.read(path, m_config.max_file_size).takeString();
        } catch (const std::system_error& e) {
            m_counters.skipped_unreadable++;
            INFINILOOM_LOG_DEBUG("Scanner", "Cannot read " + relative_path + ": " + e.what());
            return;
        }
    }

    addRecord(std::move(record));
    m_counters.total_files++;
    m_counters.total_bytes += size;
}

bool ScannerBase::isExtensionExcluded(const std::string& extension) const {
    const auto& excluded = m_config.exclude_extensions;
    if (std::find(excluded.begin(), excluded.end(), extension) != excluded.end()) {
        return true;
    }

    const auto& included = m_config.include_extensions;
    return !included.empty() &&
           std::find(included.begin(), included.end(), extension) == included.end();
}

bool ScannerBase::readHeaderIsBinary(const std::string& path, bool& is_binary) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    char header[ContentClassifier::SAMPLE_SIZE];
    file.read(header, sizeof(header));
    if (file.bad()) {
        return false;
    }

    size_t bytes_read = static_cast<size_t>(file.gcount());
    is_binary = bytes_read > 0 && ContentClassifier::isBinary(header, bytes_read);
    return true;
}

std::string ScannerBase::absolutePath(const std::string& relative_path) const {
    if (relative_path.empty()) {
        return m_root_path;
    }
    if (m_root_path == "/") {
        return m_root_path + relative_path;
    }
    return m_root_path + "/" + relative_path;
}

} // namespace Infiniloom
