#include "jsminify/driver/BatchMinifier.h"
#include "jsminify/driver/FileProcessor.h"
#include "jsminify/common/Logger.h"

#include <algorithm>
#include <thread>
#include <utility>

namespace jsminify::driver {

BatchMinifier::BatchMinifier(minifier::MinifyOptions options, size_t jobs)
    : minifier_(std::move(options)), jobs_(jobs) {
    if (jobs_ == 0) {
        jobs_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

BatchResult BatchMinifier::run(const std::vector<std::filesystem::path>& files) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        for (const auto& file : files) {
            pending_.push(file);
        }
    }

    size_t workerCount = std::min(jobs_, files.size());
    LOG_INFO("Minifying " + std::to_string(files.size()) + " files with " + std::to_string(workerCount) + " workers");

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(&BatchMinifier::workerLoop, this);
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    BatchResult result;
    {
        std::lock_guard<std::mutex> lock(resultsMutex_);
        result = std::move(results_);
        results_ = BatchResult{};
    }

    std::sort(result.stats.begin(), result.stats.end(),
              [](const MinificationStats& a, const MinificationStats& b) { return a.inputFile < b.inputFile; });
    std::sort(result.failures.begin(), result.failures.end());
    return result;
}

void BatchMinifier::workerLoop() {
    while (true) {
        std::filesystem::path file;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (pending_.empty()) {
                return;
            }
            file = std::move(pending_.front());
            pending_.pop();
        }

        try {
            MinificationStats stats = processFile(file, {}, minifier_);
            std::lock_guard<std::mutex> lock(resultsMutex_);
            results_.stats.push_back(std::move(stats));
        } catch (const std::exception& e) {
            LOG_ERROR("Skipping " + file.string() + ": " + std::string(e.what()));
            std::lock_guard<std::mutex> lock(resultsMutex_);
            results_.failures.push_back(file.string());
        }
    }
}

} // namespace jsminify::driver
