#pragma once

#include "jsminify/driver/MinificationStats.h"
#include "jsminify/minifier/Minifier.h"

#include <filesystem>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace jsminify::driver {

struct BatchResult {
    std::vector<MinificationStats> stats;   // sorted by input file
    std::vector<std::string> failures;      // inputs that were skipped

    bool ok() const { return failures.empty(); }
};

/**
 * Minifies many files on a bounded pool of worker threads, one task per
 * file. Every output goes to the file's default output path. A file that
 * fails is logged and skipped; the rest of the batch carries on.
 */
class BatchMinifier {
public:
    // jobs == 0 picks std::thread::hardware_concurrency()
    explicit BatchMinifier(minifier::MinifyOptions options, size_t jobs = 0);

    BatchResult run(const std::vector<std::filesystem::path>& files);

    size_t jobs() const { return jobs_; }

private:
    void workerLoop();

    minifier::Minifier minifier_;
    size_t jobs_;

    std::mutex queueMutex_;
    std::queue<std::filesystem::path> pending_;

    std::mutex resultsMutex_;
    BatchResult results_;
};

} // namespace jsminify::driver
