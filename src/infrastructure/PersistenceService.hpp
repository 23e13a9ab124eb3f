/**
 * @file PersistenceService.hpp
 * @brief Serialized, atomic file writes for engine state and reports.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace hemoflow::infrastructure {

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
 * @brief Background writer that applies queued writes in submission order.
 *
 * Every write goes to a temp file next to the target and is renamed over it,
 * so readers never observe a partially written file.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues @p content to replace @p filename.
     *
     * Later writes to the same file supersede earlier ones in order.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Writes immediately on the calling thread.
     * @return False if the directory, temp file or rename step failed.
     */
    bool writeAtomically(const std::string& filename, const std::string& content);

    /** @brief Blocks until every queued write has been applied. */
    void flush();

    /** @brief Drains the queue and stops the worker thread. */
    void stop();

    /** @brief Number of queued or in-flight writes that failed since construction. */
    int failedWrites() const { return m_failedWrites.load(); }

private:
    void workerLoop();

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_drained;
    bool m_busy = false;

    std::thread m_worker;
    bool m_running;
    std::atomic<int> m_failedWrites{0};
};

} // namespace hemoflow::infrastructure
