#include "jsminify/driver/FileProcessor.h"
#include "jsminify/common/Logger.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace jsminify::driver {

namespace {

bool hasSuffix(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw FileError(path, "Failed to open file for reading");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw FileError(path, "Failed to read file");
    }
    return buffer.str();
}

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw FileError(path, "Failed to open file for writing");
    }
    file << content;
    file.close();
    if (file.fail()) {
        throw FileError(path, "Failed to write file");
    }
}

fs::path defaultOutputPath(const fs::path& input) {
    fs::path output = input;
    output.replace_filename(input.stem().string() + ".min" + input.extension().string());
    return output;
}

std::vector<fs::path> listSourceFiles(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw FileError(dir, "Not a directory");
    }

    std::vector<fs::path> files;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw FileError(dir, "Error scanning directory (" + ec.message() + ")");
    }
    try {
        for (const auto& entry : it) {
            if (!entry.is_regular_file(ec)) continue;
            const std::string name = entry.path().filename().string();
            if (entry.path().extension() != ".js" || hasSuffix(name, ".min.js")) continue;
            files.push_back(entry.path());
        }
    } catch (const fs::filesystem_error& e) {
        throw FileError(dir, "Error scanning directory (" + std::string(e.what()) + ")");
    }

    std::sort(files.begin(), files.end());
    return files;
}

MinificationStats processFile(const fs::path& input, const fs::path& output, const minifier::Minifier& minifier) {
    auto start = std::chrono::steady_clock::now();

    std::string content = readFile(input);
    std::string minified = minifier.minify(content);

    fs::path target = output.empty() ? defaultOutputPath(input) : output;
    writeFile(target, minified);

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);

    MinificationStats stats;
    stats.inputFile = input.string();
    stats.outputFile = target.string();
    stats.originalSize = content.size();
    stats.minifiedSize = minified.size();
    stats.reductionPercentage = MinificationStats::reduction(content.size(), minified.size());
    stats.processTimeMs = static_cast<double>(elapsed.count()) / 1000.0;

    LOG_DEBUG("Minified " + stats.inputFile + " -> " + stats.outputFile + " (" +
              std::to_string(stats.originalSize) + " -> " + std::to_string(stats.minifiedSize) + " bytes)");
    return stats;
}

} // namespace jsminify::driver
