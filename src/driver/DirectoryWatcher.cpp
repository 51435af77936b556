#include "jsminify/driver/DirectoryWatcher.h"
#include "jsminify/driver/FileProcessor.h"
#include "jsminify/common/Logger.h"

#include <algorithm>
#include <iomanip>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace jsminify::driver {

namespace {

constexpr std::chrono::milliseconds SLEEP_SLICE{100};

} // namespace

DirectoryWatcher::DirectoryWatcher(fs::path dir, minifier::MinifyOptions options, std::chrono::milliseconds interval)
    : dir_(std::move(dir)), minifier_(std::move(options)), interval_(interval) {}

void DirectoryWatcher::run() {
    running_ = true;
    LOG_INFO("Watching directory: " + dir_.string());

    while (!stopRequested_) {
        pollOnce();

        // Sleep in slices so stop() takes effect quickly
        auto deadline = std::chrono::steady_clock::now() + interval_;
        while (!stopRequested_ && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::min(SLEEP_SLICE, interval_));
        }
    }

    running_ = false;
    LOG_INFO("Stopped watching directory: " + dir_.string());
}

std::vector<MinificationStats> DirectoryWatcher::pollOnce() {
    std::vector<MinificationStats> processed;

    std::vector<fs::path> files;
    try {
        files = listSourceFiles(dir_);
    } catch (const FileError& e) {
        LOG_ERROR(std::string(e.what()));
        return processed;
    }

    for (const auto& file : files) {
        std::error_code ec;
        auto modified = fs::last_write_time(file, ec);
        if (ec) {
            LOG_WARNING("Cannot stat " + file.string() + ": " + ec.message());
            continue;
        }

        auto it = lastSeen_.find(file);
        if (it != lastSeen_.end() && modified <= it->second) {
            continue;
        }

        LOG_INFO("Processing modified file: " + file.string());
        // Recorded even on failure so a broken file is retried only after it changes
        lastSeen_[file] = modified;
        try {
            MinificationStats stats = processFile(file, {}, minifier_);
            LOG_INFO_STREAM("Reduced by " << std::fixed << std::setprecision(2) << stats.reductionPercentage
                            << "% (" << stats.originalSize << " → " << stats.minifiedSize << " bytes)");
            processed.push_back(std::move(stats));
        } catch (const FileError& e) {
            LOG_ERROR(std::string(e.what()));
        }
    }

    return processed;
}

} // namespace jsminify::driver
