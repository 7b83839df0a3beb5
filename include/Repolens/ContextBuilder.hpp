// =================================================================
// include/Repolens/ContextBuilder.hpp
// =================================================================
// Header for assembling scanned files into a single prompt context.

#pragma once

#include "Repolens/ConcurrentWalker.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace Repolens {

/**
 * @brief Collects scanned files and renders them as one context document
 *
 * makeSink() hands out a sink that is safe to call from every reader
 * thread at once. The rendered output is ordered by path, so it does not
 * depend on which worker finished first.
 */
class ContextBuilder {
public:
    /**
     * @brief Construct a new ContextBuilder
     * @param max_tokens Token budget for build(); 0 means unlimited
     */
    explicit ContextBuilder(size_t max_tokens = 0);

    /**
     * @brief Get a sink that stores every record in this builder
     *
     * The builder must outlive every scan using the returned sink.
     */
    FileSink makeSink();

    /**
     * @brief Store one record; thread-safe
     */
    void addFile(FileRecord record);

    /**
     * @brief Render all stored files
     *
     * Each file becomes "\n--- FILE: <path> ---\n<content>\n". With a token
     * budget, files that would exceed it are left out whole and counted in
     * omittedCount().
     *
     * @return The context text
     */
    std::string build();

    /**
     * @brief Paths of the stored files, sorted
     */
    std::vector<std::string> getPaths() const;

    size_t fileCount() const { return m_file_count.load(); }
    size_t totalBytes() const;

    /**
     * @brief Number of files left out by the last build()
     */
    size_t omittedCount() const;

    void setMaxTokens(size_t max_tokens);

    void clear();

    /**
     * @brief Estimate token count for text (rough approximation: 4 chars ≈ 1 token)
     */
    static size_t estimateTokens(const std::string& text);

    /**
     * @brief Render one file with its header marker
     */
    static std::string formatFileContent(const FileRecord& record);

private:
    mutable std::mutex m_mutex;
    std::vector<FileRecord> m_records;
    std::atomic<size_t> m_file_count{0};
    size_t m_total_bytes = 0;
    size_t m_max_tokens;
    size_t m_last_omitted = 0;
};

} // namespace Repolens
