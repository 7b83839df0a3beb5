// =================================================================
// src/Repolens/ConcurrentWalker.cpp
// =================================================================
// Implementation for the parallel walk-and-read pipeline.

#include "Repolens/ConcurrentWalker.hpp"
#include "Repolens/BoundedQueue.hpp"
#include "Repolens/FileIO.hpp"
#include "Repolens/Logger.hpp"
#include "Repolens/PathFilter.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace Repolens {

namespace {

namespace fs = std::filesystem;

/**
 * State shared by the walking thread and the readers for one scan call.
 */
struct WalkState {
    explicit WalkState(size_t queue_capacity) : queue(queue_capacity) {}

    BoundedQueue<std::string> queue;
    std::atomic<size_t> files_delivered{0};
    std::atomic<size_t> files_skipped{0};

    // Walking thread only
    size_t files_dispatched = 0;
    size_t directories_pruned = 0;
    std::error_code error;
    std::string error_path;
    std::string error_message;
};

void readFiles(WalkState& state, const FileSink& sink, std::uintmax_t max_file_size) {
    FileIO io;
    while (std::optional<std::string> path = state.queue.pop()) {
        FileRecord record;
        record.path = std::move(*path);

        try {
            record.content = io.readFile(record.path, max_file_size);
        } catch (const std::exception& e) {
            ++state.files_skipped;
            REPOLENS_LOG_DEBUG("ConcurrentWalker", std::string("Skipping file: ") + e.what());
            continue;
        }

        std::string delivered_path = record.path;
        try {
            sink(std::move(record));
            ++state.files_delivered;
        } catch (const std::exception& e) {
            ++state.files_skipped;
            REPOLENS_LOG_ERROR("ConcurrentWalker",
                "Sink rejected " + delivered_path + ": " + e.what());
        } catch (...) {
            // Anything escaping a reader thread would terminate the process
            ++state.files_skipped;
            REPOLENS_LOG_ERROR("ConcurrentWalker",
                "Sink rejected " + delivered_path + " with a non-standard exception");
        }
    }
}

/**
 * Fixed set of reader threads. Destruction closes the queue and joins, so
 * no reader outlives the scan even if the walk throws.
 */
class ReaderPool {
public:
    explicit ReaderPool(WalkState& state) : m_state(state) {}

    ~ReaderPool() {
        shutdown();
    }

    ReaderPool(const ReaderPool&) = delete;
    ReaderPool& operator=(const ReaderPool&) = delete;

    void start(size_t worker_count, const FileSink& sink, std::uintmax_t max_file_size) {
        m_threads.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) {
            m_threads.emplace_back(readFiles, std::ref(m_state), std::cref(sink), max_file_size);
        }
    }

    void shutdown() {
        m_state.queue.close();
        for (auto& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        m_threads.clear();
    }

private:
    WalkState& m_state;
    std::vector<std::thread> m_threads;
};

std::string baseName(const fs::path& path) {
    fs::path name = path.filename();
    if (name.empty()) {
        // "dir/" has an empty filename
        name = path.parent_path().filename();
    }
    return name.string();
}

void recordWalkError(WalkState& state, const std::error_code& ec,
                     const fs::path& path, const std::string& what) {
    if (state.error) {
        return;
    }
    state.error = ec;
    state.error_path = path.string();
    state.error_message = what + " '" + state.error_path + "': " + ec.message();
}

void dispatchFile(const fs::path& path, const fs::file_status& status,
                  const PathFilter& filter, WalkState& state) {
    if (!filter.shouldInclude(path.string(), baseName(path))) {
        return;
    }

    if (fs::is_symlink(status)) {
        std::error_code ec;
        if (!fs::is_regular_file(fs::status(path, ec))) {
            REPOLENS_LOG_DEBUG("ConcurrentWalker", "Skipping link to a non-regular file: " + path.string());
            return;
        }
    } else if (!fs::is_regular_file(status)) {
        REPOLENS_LOG_DEBUG("ConcurrentWalker", "Skipping special file: " + path.string());
        return;
    }

    if (state.queue.push(path.string())) {
        ++state.files_dispatched;
    }
}

/**
 * Depth-first walk in lexical order. Returns false once a walk-level
 * error has been recorded, which stops the whole walk.
 */
bool walkDirectory(const fs::path& dir, const PathFilter& filter, WalkState& state) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        recordWalkError(state, ec, dir, "Failed to read directory");
        return false;
    }

    std::vector<fs::directory_entry> entries;
    while (it != fs::directory_iterator()) {
        entries.push_back(*it);
        it.increment(ec);
        if (ec) {
            recordWalkError(state, ec, dir, "Failed to read directory");
            return false;
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().native() < b.path().filename().native();
              });

    for (const auto& entry : entries) {
        std::error_code status_ec;
        fs::file_status status = entry.symlink_status(status_ec);
        if (status_ec) {
            // Removed between listing and inspection
            REPOLENS_LOG_DEBUG("ConcurrentWalker", "Skipping vanished entry: " + entry.path().string());
            continue;
        }

        if (fs::is_directory(status)) {
            if (!filter.shouldDescend(baseName(entry.path()))) {
                ++state.directories_pruned;
                continue;
            }
            if (!walkDirectory(entry.path(), filter, state)) {
                return false;
            }
        } else {
            dispatchFile(entry.path(), status, filter, state);
        }
    }

    return true;
}

void walkRoot(const ScanConfig& config, const PathFilter& filter, WalkState& state) {
    fs::path root(config.root);

    // The root itself is followed if it is a link
    std::error_code ec;
    fs::file_status status = fs::status(root, ec);
    if (!ec && !fs::exists(status)) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
    if (ec) {
        recordWalkError(state, ec, root, "Cannot access scan root");
        return;
    }

    if (!fs::is_directory(status)) {
        dispatchFile(root, status, filter, state);
        return;
    }

    std::string name = baseName(root);
    if (!name.empty() && !filter.shouldDescend(name)) {
        ++state.directories_pruned;
        return;
    }

    walkDirectory(root, filter, state);
}

} // namespace

ConcurrentWalker::ConcurrentWalker(size_t queue_capacity)
    : m_queue_capacity(queue_capacity)
{
    if (queue_capacity == 0) {
        throw std::invalid_argument("ConcurrentWalker queue capacity must be at least 1");
    }
}

ScanResult ConcurrentWalker::scan(const ScanConfig& config, size_t worker_count, const FileSink& sink) const {
    if (worker_count == 0) {
        throw std::invalid_argument("ConcurrentWalker::scan requires at least one worker");
    }
    if (!sink) {
        throw std::invalid_argument("ConcurrentWalker::scan requires a sink");
    }

    auto start_time = std::chrono::steady_clock::now();

    PathFilter filter(config);
    WalkState state(m_queue_capacity);

    REPOLENS_LOG_DEBUG("ConcurrentWalker", "Scanning " + config.root + " with "
        + std::to_string(worker_count) + " workers");

    {
        ReaderPool pool(state);
        pool.start(worker_count, sink, config.max_file_size);
        walkRoot(config, filter, state);
        pool.shutdown();
    }

    ScanResult result;
    result.success = !state.error;
    result.error_code = state.error;
    result.error_path = state.error_path;
    result.error_message = state.error_message;
    result.files_dispatched = state.files_dispatched;
    result.files_delivered = state.files_delivered.load();
    result.files_skipped = state.files_skipped.load();
    result.directories_pruned = state.directories_pruned;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return result;
}

} // namespace Repolens
