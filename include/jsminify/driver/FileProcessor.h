#pragma once

#include "jsminify/driver/MinificationStats.h"
#include "jsminify/minifier/Minifier.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace jsminify::driver {

// I/O failure on a specific path (unreadable input, unwritable output, bad directory)
class FileError : public std::runtime_error {
public:
    FileError(const std::filesystem::path& path, const std::string& message)
        : std::runtime_error(message + ": " + path.string()), path_(path) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

std::string readFile(const std::filesystem::path& path);
void writeFile(const std::filesystem::path& path, const std::string& content);

// app.js -> app.min.js, next to the input
std::filesystem::path defaultOutputPath(const std::filesystem::path& input);

// *.js files directly inside dir, without *.min.js, sorted by path
std::vector<std::filesystem::path> listSourceFiles(const std::filesystem::path& dir);

/**
 * Reads input, minifies it and writes the result. An empty output path
 * selects defaultOutputPath(input). Throws FileError on I/O failure.
 */
MinificationStats processFile(const std::filesystem::path& input,
                              const std::filesystem::path& output,
                              const minifier::Minifier& minifier);

} // namespace jsminify::driver
