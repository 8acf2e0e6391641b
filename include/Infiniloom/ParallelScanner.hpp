// =================================================================
// include/Infiniloom/ParallelScanner.hpp
// =================================================================
// Header for the multi-threaded directory scanner.

#pragma once

#include "Infiniloom/ScannerBase.hpp"
#include "Infiniloom/WorkQueue.hpp"
#include <exception>
#include <mutex>
#include <utility>

namespace Infiniloom {

/**
 * @brief Scans a directory tree with a bounded pool of worker threads
 *
 * Every directory is a work item on a shared FIFO. A worker lists one
 * directory, processes its files and pushes its subdirectories back on
 * the queue. The walk ends when the queue is empty and no worker is
 * busy. Produces the same file set and totals as DirectoryScanner, in
 * no particular order.
 */
class ParallelScanner : public ScannerBase {
public:
    explicit ParallelScanner(WalkConfiguration config = WalkConfiguration())
        : ScannerBase(std::move(config)) {}

    /**
     * @brief Number of workers a walk will use
     * @return min(available parallelism, configured cap), at least 1
     */
    size_t getThreadCount() const;

protected:
    void traverse() override;
    void enqueueDirectory(const std::string& relative_path) override;
    bool isIgnored(const std::string& relative_path, bool is_directory) const override;
    void addRecord(FileRecord record) override;
    bool isParallel() const override { return true; }

private:
    WorkQueue<std::string>* m_queue = nullptr;
    mutable std::mutex m_state_mutex;
    std::exception_ptr m_failure;

    void workerLoop();
};

} // namespace Infiniloom
