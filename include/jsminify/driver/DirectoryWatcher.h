#pragma once

#include "jsminify/driver/MinificationStats.h"
#include "jsminify/minifier/Minifier.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <vector>

namespace jsminify::driver {

/**
 * Polls a directory and re-minifies every *.js file whose last write time
 * moved forward since it was last seen. Output goes to the default
 * <name>.min.js path, which the scan itself ignores.
 */
class DirectoryWatcher {
public:
    DirectoryWatcher(std::filesystem::path dir,
                     minifier::MinifyOptions options,
                     std::chrono::milliseconds interval = std::chrono::milliseconds(1000));

    // Blocks, polling every interval, until stop() is called. Returns at
    // once if stop() already happened.
    void run();

    // Safe to call from another thread or a signal handler, also before run().
    void stop() { stopRequested_ = true; }

    bool isRunning() const { return running_; }

    // One scan. Returns the stats of the files minified during it.
    std::vector<MinificationStats> pollOnce();

private:
    std::filesystem::path dir_;
    minifier::Minifier minifier_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::map<std::filesystem::path, std::filesystem::file_time_type> lastSeen_;
};

} // namespace jsminify::driver
