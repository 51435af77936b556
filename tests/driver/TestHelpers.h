#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

// Fresh, empty directory under the system temp dir
inline std::filesystem::path makeTestDirectory(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("jsminify_test_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline void writeJsFile(const std::filesystem::path& filePath, const std::string& content) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filePath.string());
    }
    file << content;
}

inline std::string readBack(const std::filesystem::path& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filePath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}
