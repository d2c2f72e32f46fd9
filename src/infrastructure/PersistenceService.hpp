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
#include <future>

namespace docudigest::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;              ///< Written in binary mode.
    std::promise<void> done;          ///< Fulfilled once the rename succeeded.
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * All writes pass through a single serialized queue, so two writers of the
 * same file never interleave. Each write is temp file -> rename.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues content to be written to a file.
     * @param filename Absolute path to the file.
     * @param content Bytes to write.
     * @return Future that becomes ready when the file is in place, or holds the I/O error.
     */
    std::future<void> saveAsync(const std::string& filename, std::string content);

    /**
     * @brief Writes content and waits for completion.
     * @throws std::runtime_error (or std::filesystem::filesystem_error) on failure.
     */
    void save(const std::string& filename, std::string content);

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename). Throws on failure.
     */
    void performAtomicWrite(const SaveTask& task);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<unsigned long long> m_sequence{0};
};

} // namespace docudigest::infrastructure
