/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace docudigest::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::future<void> PersistenceService::saveAsync(const std::string& filename, std::string content) {
    SaveTask task;
    task.filename = filename;
    task.content = std::move(content);
    std::future<void> result = task.done.get_future();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            task.done.set_exception(std::make_exception_ptr(
                std::runtime_error("PersistenceService stopped, cannot write " + filename)));
            return result;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
    return result;
}

void PersistenceService::save(const std::string& filename, std::string content) {
    saveAsync(filename, std::move(content)).get();
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return; // Exit point
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        // Process outside lock
        try {
            performAtomicWrite(task);
            task.done.set_value();
        } catch (const std::exception& e) {
            std::cerr << "[PersistenceService] " << e.what() << std::endl;
            task.done.set_exception(std::current_exception());
        }
    }
}

void PersistenceService::performAtomicWrite(const SaveTask& task) {
    fs::path finalPath = task.filename;

    // Unique temp path per operation: filename.<timestamp>.<seq>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(m_sequence++) + ".tmp";

    // 1. Ensure directory exists
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
        fs::create_directories(finalPath.parent_path());
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        ofs.write(task.content.data(), static_cast<std::streamsize>(task.content.size()));
        ofs.flush();
        if (ofs.fail()) {
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw std::runtime_error("Write failed during output: " + tempPath.string());
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw fs::filesystem_error("Rename failed", tempPath, finalPath, ec);
    }
}

} // namespace docudigest::infrastructure
