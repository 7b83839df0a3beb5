// =================================================================
// include/Repolens/FileIO.hpp
// =================================================================
// Defines the file-level operations used by the walker and the CLI.

#pragma once

#include <cstdint>
#include <string>

namespace Repolens {

class FileIO {
public:
    /**
     * @brief Reads the entire content of a file as raw bytes.
     * @param file_path The path to the file.
     * @param max_size Maximum accepted size in bytes; 0 disables the limit.
     * @return The content of the file. Throws std::system_error if the file
     *         cannot be opened or read, std::length_error if it exceeds max_size.
     */
    std::string readFile(const std::string& file_path, std::uintmax_t max_size = 0) const;

    /**
     * @brief Writes content to a file, overwriting it.
     * @return True on success, false on failure.
     */
    bool writeFile(const std::string& file_path, const std::string& content) const;

    /**
     * @brief Checks if a regular file exists (symlinks are followed).
     */
    bool fileExists(const std::string& file_path) const;

    /**
     * @brief Checks if a directory exists (symlinks are followed).
     */
    bool directoryExists(const std::string& dir_path) const;

    /**
     * @brief Creates a directory and any missing parents.
     * @return True if the directory exists afterwards.
     */
    bool createDirectory(const std::string& dir_path) const;
};

} // namespace Repolens
