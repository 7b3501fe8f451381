/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace learnpath::infrastructure {

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

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Stopped, writing synchronously: " << filename << std::endl;
        } else {
            m_queue.push(SaveTask{filename, content});
            m_cv.notify_one();
            return;
        }
    }
    if (!WriteAtomic(filename, content)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_failedWrites;
    }
}

bool PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_queue.empty() && !m_busy; });
    const bool ok = m_failedWrites == 0;
    m_failedWrites = 0;
    return ok;
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
                m_idleCv.notify_all();
                return;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        const bool ok = WriteAtomic(task.filename, task.content);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
            if (!ok) ++m_failedWrites;
        }
        m_idleCv.notify_all();
    }
}

bool PersistenceService::WriteAtomic(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // Unique temp path per operation: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[PersistenceService] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

} // namespace learnpath::infrastructure
