/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background engine tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <future>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>
#include <chrono>
#include <thread>

namespace hemoflow::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Training
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;   ///< Written before isCompleted is set.
    std::shared_future<void> done;

    /** @brief Blocks until the task finished or @p timeout elapsed. Returns isCompleted. */
    bool waitFor(std::chrono::milliseconds timeout) const {
        if (done.valid()) {
            done.wait_for(timeout);
        }
        return isCompleted.load();
    }
};

/**
 * @class AsyncTaskManager
 * @brief Runs tasks on their own threads and tracks them until they finish.
 *
 * The destructor waits for every task still running, so tasks may safely
 * reference services that outlive the manager.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        waitAll();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Submits a new task; @p f receives the status as its first argument. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        auto promise = std::make_shared<std::promise<void>>();
        status->done = promise->get_future().share();

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
            ++m_running;
        }

        std::thread([this, status, promise](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->errorMessage = e.what();
                status->failed = true;
            }
            status->isCompleted = true;
            promise->set_value();
            CleanupCompletedTasks();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Tasks that have not finished yet. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until no task is running. */
    void waitAll() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idle.wait(lock, [this] { return m_running == 0; });
    }

private:
    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
        --m_running;
        m_idle.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
    std::condition_variable m_idle;
    int m_running = 0;
};

} // namespace hemoflow::application
