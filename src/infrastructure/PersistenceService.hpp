/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <cstddef>

namespace learnpath::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * All plan and cache-index writes pass through a single serialized queue, so
 * a reader never sees a half-written file and two writes to the same path
 * land in submission order.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Blocks until every queued write has been performed.
     * @return false if any write since the previous flush failed.
     */
    bool flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

    /** @brief Synchronous temp-file + rename write used by the worker. */
    static bool WriteAtomic(const std::string& filename, const std::string& content);

private:
    void workerLoop();

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;
    std::size_t m_failedWrites = 0;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace learnpath::infrastructure
