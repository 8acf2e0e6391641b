// =================================================================
// src/Infiniloom/ParallelScanner.cpp
// =================================================================
// Implementation for the multi-threaded directory scanner.

#include "Infiniloom/ParallelScanner.hpp"
#include "Infiniloom/Logger.hpp"
#include <algorithm>
#include <system_error>
#include <thread>
#include <vector>

namespace Infiniloom {

size_t ParallelScanner::getThreadCount() const {
    size_t available = std::thread::hardware_concurrency();
    if (available == 0) {
        available = 4;
    }
    size_t cap = getConfig().max_threads == 0 ? 1 : getConfig().max_threads;
    return std::min(available, cap);
}

void ParallelScanner::traverse() {
    WorkQueue<std::string> queue;
    m_queue = &queue;
    m_failure = nullptr;

    queue.push("");

    std::vector<std::thread> workers;
    size_t thread_count = getThreadCount();
    for (size_t i = 0; i < thread_count; ++i) {
        try {
            workers.emplace_back([this] { workerLoop(); });
        } catch (const std::system_error& e) {
            INFINILOOM_LOG_WARNING("ParallelScanner",
                                   "Started " + std::to_string(workers.size()) + " of " +
                                   std::to_string(thread_count) + " workers: " + e.what());
            break;
        }
    }

    // Without any worker the calling thread drains the queue itself
    if (workers.empty()) {
        workerLoop();
    }

    for (std::thread& worker : workers) {
        worker.join();
    }
    m_queue = nullptr;

    if (m_failure) {
        std::exception_ptr failure = m_failure;
        m_failure = nullptr;
        std::rethrow_exception(failure);
    }
}

void ParallelScanner::workerLoop() {
    std::string directory;
    while (m_queue->pop(directory)) {
        try {
            scanDirectory(directory);
        } catch (...) {
            // Abort the whole walk; the first failure is rethrown after join
            {
                std::lock_guard<std::mutex> lock(m_state_mutex);
                if (!m_failure) {
                    m_failure = std::current_exception();
                }
            }
            m_queue->markDone();
        }
        m_queue->taskDone();
    }
}

void ParallelScanner::enqueueDirectory(const std::string& relative_path) {
    m_queue->push(relative_path);
}

bool ParallelScanner::isIgnored(const std::string& relative_path, bool is_directory) const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return ScannerBase::isIgnored(relative_path, is_directory);
}

void ParallelScanner::addRecord(FileRecord record) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    ScannerBase::addRecord(std::move(record));
}

} // namespace Infiniloom
