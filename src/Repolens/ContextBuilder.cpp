// =================================================================
// src/Repolens/ContextBuilder.cpp
// =================================================================
// Implementation for assembling scanned files into a single prompt context.

#include "Repolens/ContextBuilder.hpp"
#include "Repolens/Logger.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace Repolens {

ContextBuilder::ContextBuilder(size_t max_tokens)
    : m_max_tokens(max_tokens) {
}

FileSink ContextBuilder::makeSink() {
    return [this](FileRecord record) {
        addFile(std::move(record));
    };
}

void ContextBuilder::addFile(FileRecord record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_total_bytes += record.content.size();
    m_records.push_back(std::move(record));
    ++m_file_count;
}

std::string ContextBuilder::build() {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::sort(m_records.begin(), m_records.end(),
              [](const FileRecord& a, const FileRecord& b) { return a.path < b.path; });

    std::ostringstream context;
    size_t used_tokens = 0;
    m_last_omitted = 0;

    for (const auto& record : m_records) {
        std::string formatted = formatFileContent(record);
        size_t file_tokens = estimateTokens(formatted);

        if (m_max_tokens > 0 && used_tokens + file_tokens > m_max_tokens) {
            m_last_omitted++;
            continue;
        }

        context << formatted;
        used_tokens += file_tokens;
    }

    if (m_last_omitted > 0) {
        Logger::getInstance().warning("ContextBuilder",
            "Token budget reached, some files were left out",
            "Omitted: " + std::to_string(m_last_omitted) + ", Budget: " + std::to_string(m_max_tokens));
    }

    return context.str();
}

std::vector<std::string> ContextBuilder::getPaths() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> paths;
    paths.reserve(m_records.size());
    for (const auto& record : m_records) {
        paths.push_back(record.path);
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

size_t ContextBuilder::omittedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_omitted;
}

size_t ContextBuilder::totalBytes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total_bytes;
}

void ContextBuilder::setMaxTokens(size_t max_tokens) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_max_tokens = max_tokens;
}

void ContextBuilder::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.clear();
    m_total_bytes = 0;
    m_last_omitted = 0;
    m_file_count = 0;
}

size_t ContextBuilder::estimateTokens(const std::string& text) {
    return (text.length() + 3) / 4;
}

std::string ContextBuilder::formatFileContent(const FileRecord& record) {
    std::string formatted;
    formatted.reserve(record.path.size() + record.content.size() + 16);
    formatted += "\n--- FILE: ";
    formatted += record.path;
    formatted += " ---\n";
    formatted += record.content;
    formatted += "\n";
    return formatted;
}

} // namespace Repolens
