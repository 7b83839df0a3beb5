// =================================================================
// src/Repolens/FileIO.cpp
// =================================================================
// Implementation for file-level operations.

#include "Repolens/FileIO.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace Repolens {

std::string FileIO::readFile(const std::string& file_path, std::uintmax_t max_size) const {
    if (max_size > 0) {
        std::error_code ec;
        std::uintmax_t size = std::filesystem::file_size(file_path, ec);
        if (ec) {
            throw std::system_error(ec, "Failed to stat file: " + file_path);
        }
        if (size > max_size) {
            throw std::length_error("File exceeds size limit (" + std::to_string(size)
                                    + " > " + std::to_string(max_size) + " bytes): " + file_path);
        }
    }

    errno = 0;
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        int error = errno != 0 ? errno : EIO;
        throw std::system_error(error, std::generic_category(), "Failed to open file: " + file_path);
    }

    std::string content((std::istreambuf_iterator<char>(file_stream)),
                        std::istreambuf_iterator<char>());
    if (file_stream.bad()) {
        throw std::system_error(EIO, std::generic_category(), "Failed to read file: " + file_path);
    }
    return content;
}

bool FileIO::writeFile(const std::string& file_path, const std::string& content) const {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        return false;
    }
    file_stream << content;
    file_stream.flush();
    return file_stream.good();
}

bool FileIO::fileExists(const std::string& file_path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(file_path, ec);
}

bool FileIO::directoryExists(const std::string& dir_path) const {
    std::error_code ec;
    return std::filesystem::is_directory(dir_path, ec);
}

bool FileIO::createDirectory(const std::string& dir_path) const {
    std::error_code ec;
    std::filesystem::create_directories(dir_path, ec);
    return !ec && directoryExists(dir_path);
}

} // namespace Repolens
