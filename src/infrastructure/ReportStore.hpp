/**
 * @file ReportStore.hpp
 * @brief Serialized, atomic writes of exported audit reports.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace scribeaudit::infrastructure {

/**
 * @struct WriteTask
 * @brief A single file write operation.
 */
struct WriteTask {
    std::string filename;
    std::string content;
};

/**
 * @class ReportStore
 * @brief Background thread that writes report files one at a time (temp file, then rename).
 *
 * Concurrent audits may queue reports freely; the single worker ensures two
 * writes never race on the same path and readers never see a half-written file.
 */
class ReportStore {
public:
    explicit ReportStore(std::string reportsDir);
    ~ReportStore();

    ReportStore(const ReportStore&) = delete;
    ReportStore& operator=(const ReportStore&) = delete;

    /**
     * @brief Queues a report for writing.
     * @param name File name relative to the reports directory.
     * @return Full path the report will be written to.
     */
    std::string saveAsync(const std::string& name, const std::string& content);

    /** @brief Report file name for a student, e.g. "S123.json". Unsafe characters become '_'. */
    static std::string FileNameFor(const std::string& studentId, const std::string& extension);

    /**
     * @brief Stops the worker thread after all pending writes are processed.
     */
    void stop();

    /** @brief Writes that failed so far (logged as they happen). */
    std::size_t failureCount() const { return m_failures.load(); }

    const std::string& reportsDir() const { return m_reportsDir; }

private:
    void workerLoop();

    /** @brief Performs the actual atomic write (temp -> rename). Returns false on failure. */
    bool performAtomicWrite(const WriteTask& task);

    std::string m_reportsDir;

    std::queue<WriteTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<std::size_t> m_failures{0};
};

} // namespace scribeaudit::infrastructure
