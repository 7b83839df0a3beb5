// =================================================================
// include/Repolens/ConcurrentWalker.hpp
// =================================================================
// Header for the parallel walk-and-read pipeline.

#pragma once

#include "Repolens/ScanConfig.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <system_error>

namespace Repolens {

/**
 * @brief One accepted, successfully read file
 */
struct FileRecord {
    std::string path;     ///< Path as reached from the scan root
    std::string content;  ///< Raw file bytes
};

/**
 * @brief Receives each file of a scan
 *
 * Called from worker threads, possibly from several at once and in no
 * particular order. Any synchronization the sink needs is its own.
 */
using FileSink = std::function<void(FileRecord)>;

/**
 * @brief Outcome of a scan
 *
 * `success` is false only for walk-level errors (missing root, unreadable
 * directory). Files that could not be read are counted in `files_skipped`.
 */
struct ScanResult {
    bool success = true;                          ///< Whether the whole tree was walked
    std::string error_message;                    ///< First walk-level error, if any
    std::error_code error_code;                   ///< System error behind error_message
    std::string error_path;                       ///< Path the walk failed on
    size_t files_dispatched = 0;                  ///< Paths handed to workers
    size_t files_delivered = 0;                   ///< Sink invocations that returned normally
    size_t files_skipped = 0;                     ///< Dispatched paths that produced no delivery
    size_t directories_pruned = 0;                ///< Ignored directories not walked into
    std::chrono::milliseconds duration{0};        ///< Wall time of the scan
};

/**
 * @brief Walks a tree on the calling thread and reads files on a worker pool
 *
 * Accepted paths travel through a bounded queue, so a slow sink slows the
 * walk instead of growing memory. scan() returns only after every worker
 * has exited; no sink call can happen after it returns.
 */
class ConcurrentWalker {
public:
    static constexpr size_t kDefaultQueueCapacity = 100;

    /**
     * @brief Construct a walker
     * @param queue_capacity Maximum number of paths waiting for a worker
     */
    explicit ConcurrentWalker(size_t queue_capacity = kDefaultQueueCapacity);

    /**
     * @brief Scan a tree and deliver every accepted file to the sink
     * @param config What to walk and how to filter it
     * @param worker_count Number of reader threads, at least 1
     * @param sink Called once per successfully read file
     * @return The first walk-level error (if any) and scan statistics
     * @throws std::invalid_argument if worker_count is 0 or sink is empty
     */
    ScanResult scan(const ScanConfig& config, size_t worker_count, const FileSink& sink) const;

    size_t getQueueCapacity() const { return m_queue_capacity; }

private:
    size_t m_queue_capacity;
};

} // namespace Repolens
