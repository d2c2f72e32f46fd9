/**
 * @file AsyncTaskManager.hpp
 * @brief Background execution of document processing attempts.
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
#include <thread>

namespace docudigest::application {

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Written once before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Runs tasks on their own threads and tracks them until they finish.
 *
 * Different documents run concurrently; serialization per document id is the
 * responsibility of the submitted work. The destructor waits for all tasks.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        WaitAll();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Submits a new task; f receives the task status as first argument. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
            ++m_running;
        }

        std::thread([this, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
            } catch (const std::exception& e) {
                status->errorMessage = e.what();
                status->failed = true;
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until every submitted task has completed. */
    void WaitAll() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_allDone.wait(lock, [this] { return m_running == 0; });
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
        m_allDone.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
    std::condition_variable m_allDone;
    int m_running = 0;
};

} // namespace docudigest::application
