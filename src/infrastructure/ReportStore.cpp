/**
 * @file ReportStore.cpp
 * @brief Implementation of ReportStore.
 */

#include "infrastructure/ReportStore.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace scribeaudit::infrastructure {

namespace fs = std::filesystem;

ReportStore::ReportStore(std::string reportsDir) : m_reportsDir(std::move(reportsDir)), m_running(true) {
    m_worker = std::thread(&ReportStore::workerLoop, this);
}

ReportStore::~ReportStore() {
    stop();
}

void ReportStore::stop() {
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

std::string ReportStore::FileNameFor(const std::string& studentId, const std::string& extension) {
    std::string name;
    for (unsigned char c : studentId) {
        name += (std::isalnum(c) || c == '-' || c == '_' || c == '.') ? static_cast<char>(c) : '_';
    }
    if (name.empty() || name.front() == '.') name = "report" + name;
    return name + extension;
}

std::string ReportStore::saveAsync(const std::string& name, const std::string& content) {
    const std::string path = (fs::path(m_reportsDir) / name).string();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push(WriteTask{path, content});
    }
    m_cv.notify_one();
    return path;
}

void ReportStore::workerLoop() {
    while (true) {
        WriteTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        if (!performAtomicWrite(task)) {
            ++m_failures;
        }
    }
}

bool ReportStore::performAtomicWrite(const WriteTask& task) {
    fs::path finalPath = task.filename;

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[ReportStore] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[ReportStore] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[ReportStore] Write failed: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[ReportStore] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

} // namespace scribeaudit::infrastructure
