/**
 * @file ParallelExecutor.hpp
 * @brief Bounded worker pool with cooperative cancellation.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace learnpath::application {

/**
 * @class CancellationToken
 * @brief Shared flag checked between units of work.
 *
 * cancel() only stores a lock-free atomic, so it may be called from a
 * signal handler.
 */
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }
    void reset() { m_cancelled.store(false); }

private:
    std::atomic<bool> m_cancelled{false};
};

/**
 * @class ParallelExecutor
 * @brief Runs task(i) for every index on at most workerCount threads.
 *
 * Each task owns its index; callers write results into a pre-sized slot per
 * index and read them after forEach() returns, once all workers joined.
 */
class ParallelExecutor {
public:
    explicit ParallelExecutor(std::size_t workerCount)
        : m_workerCount(std::max<std::size_t>(1, workerCount)) {}

    std::size_t workerCount() const { return m_workerCount; }

    /**
     * @brief Blocks until every started task finished.
     *
     * Indices are handed out in increasing order. The token is checked
     * before each index; once cancelled no new task starts.
     * The first exception thrown by a task is rethrown after the join.
     * @return Number of tasks that were started.
     */
    std::size_t forEach(std::size_t count,
                        const std::function<void(std::size_t)>& task,
                        const CancellationToken* cancel = nullptr) const {
        if (count == 0) {
            return 0;
        }

        std::atomic<std::size_t> next{0};
        std::atomic<std::size_t> started{0};
        std::exception_ptr firstError;
        std::mutex errorMutex;

        auto worker = [&]() {
            while (true) {
                if (cancel && cancel->isCancelled()) return;
                {
                    std::lock_guard<std::mutex> lock(errorMutex);
                    if (firstError) return;
                }
                const std::size_t index = next.fetch_add(1);
                if (index >= count) return;
                started.fetch_add(1);
                try {
                    task(index);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(errorMutex);
                    if (!firstError) firstError = std::current_exception();
                }
            }
        };

        const std::size_t threadCount = std::min(m_workerCount, count);
        if (threadCount == 1) {
            worker();
        } else {
            std::vector<std::thread> threads;
            threads.reserve(threadCount);
            for (std::size_t i = 0; i < threadCount; ++i) {
                threads.emplace_back(worker);
            }
            for (auto& thread : threads) {
                thread.join();
            }
        }

        if (firstError) {
            std::rethrow_exception(firstError);
        }
        return started.load();
    }

private:
    std::size_t m_workerCount;
};

} // namespace learnpath::application
