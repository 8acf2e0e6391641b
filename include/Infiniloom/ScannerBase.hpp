// =================================================================
// include/Infiniloom/ScannerBase.hpp
// =================================================================
// Header for the traversal policy shared by the serial and parallel
// directory scanners.

#pragma once

#include "Infiniloom/IgnorePattern.hpp"
#include "Infiniloom/Types.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace Infiniloom {

/**
 * @brief Per-category tallies updated concurrently during a walk
 */
struct ScanCounters {
    std::atomic<uint32_t> total_files{0};
    std::atomic<uint64_t> total_bytes{0};
    std::atomic<uint32_t> skipped_binary{0};
    std::atomic<uint32_t> skipped_size{0};
    std::atomic<uint32_t> skipped_ignored{0};
    std::atomic<uint32_t> skipped_hidden{0};
    std::atomic<uint32_t> skipped_extension{0};
    std::atomic<uint32_t> skipped_unreadable{0};
    std::atomic<uint32_t> directories_failed{0};

    void reset();
    ScanStatistics snapshot() const;
};

/**
 * @brief Walks a directory tree and collects qualifying files
 *
 * For every entry: hidden names are skipped unless configured otherwise,
 * ignore rules are consulted before any I/O, directories are handed to
 * enqueueDirectory(), and files go through the size limit, the extension
 * lists and a binary check on their leading bytes. Per-entry failures
 * are counted, never thrown. Subclasses decide how directories are
 * scheduled.
 */
class ScannerBase {
public:
    explicit ScannerBase(WalkConfiguration config = WalkConfiguration());
    virtual ~ScannerBase() = default;

    ScannerBase(const ScannerBase&) = delete;
    ScannerBase& operator=(const ScannerBase&) = delete;

    /**
     * @brief Scan a directory tree, replacing any previous results
     * @param root_path Directory to scan
     * @throws ScanError if the root does not exist, is not a directory
     *         or cannot be listed
     * @throws std::bad_alloc if memory runs out
     */
    void walk(const std::string& root_path);

    /**
     * @brief Get the files accepted by the last walk
     */
    const std::vector<FileRecord>& getFiles() const { return m_files; }

    /**
     * @brief Move the accepted files out of the scanner
     */
    std::vector<FileRecord> takeFiles();

    /**
     * @brief Get the statistics of the last walk
     */
    const ScanStatistics& getStats() const { return m_stats; }

    /**
     * @brief Get the absolute root of the last walk
     */
    const std::string& getRootPath() const { return m_root_path; }

    const WalkConfiguration& getConfig() const { return m_config; }

    const IgnoreMatcher& getIgnoreMatcher() const { return m_ignore; }

protected:
    /**
     * @brief Visit the whole tree starting at the root (relative path "")
     */
    virtual void traverse() = 0;

    /**
     * @brief Schedule a subdirectory for scanning
     * @param relative_path Directory path relative to the root
     */
    virtual void enqueueDirectory(const std::string& relative_path) = 0;

    /**
     * @brief Consult the ignore rules
     */
    virtual bool isIgnored(const std::string& relative_path, bool is_directory) const;

    /**
     * @brief Store an accepted file
     */
    virtual void addRecord(FileRecord record);

    /**
     * @brief Whether the scan of this walk reports as parallel in logs
     */
    virtual bool isParallel() const { return false; }

    /**
     * @brief List one directory and handle each of its entries
     * @param relative_path Directory path relative to the root, "" for the root
     */
    void scanDirectory(const std::string& relative_path);

    ScanCounters m_counters;

private:
    WalkConfiguration m_config;
    IgnoreMatcher m_ignore;
    std::string m_root_path;
    std::vector<FileRecord> m_files;
    ScanStatistics m_stats;

    void prepare(const std::string& root_path);
    void processFile(const std::string& relative_path, const std::string& name);
    bool isExtensionExcluded(const std::string& extension) const;
    bool readHeaderIsBinary(const std::string& path, bool& is_binary) const;
    std::string absolutePath(const std::string& relative_path) const;
};

} // namespace Infiniloom
