#include "jsminify/common/Logger.h"
#include "jsminify/driver/BatchMinifier.h"
#include "jsminify/driver/CommandLine.h"
#include "jsminify/driver/DirectoryWatcher.h"
#include "jsminify/driver/FileProcessor.h"
#include "jsminify/driver/Report.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <system_error>

using namespace jsminify;
using namespace jsminify::driver;

namespace {

std::atomic<DirectoryWatcher*> g_watcher{nullptr};

void installStopHandler() {
    auto handler = [](int) {
        if (DirectoryWatcher* watcher = g_watcher.load()) {
            watcher->stop();
        }
    };
    std::signal(SIGINT, handler);
    std::signal(SIGTERM, handler);
}

int runSingleFile(const AppConfig& config, const minifier::MinifyOptions& options) {
    MinificationStats stats;
    try {
        stats = processFile(config.input, config.output, minifier::Minifier(options));
    } catch (const FileError& e) {
        LOG_ERROR(std::string(e.what()));
        return 1;
    }

    std::cout << (config.jsonOutput ? formatJson(stats) + "\n" : formatText(stats));
    return 0;
}

int runDirectory(const AppConfig& config, const minifier::MinifyOptions& options) {
    if (config.watch) {
        DirectoryWatcher watcher(config.input, options, config.watchInterval);
        g_watcher = &watcher;
        installStopHandler();
        watcher.run();
        g_watcher = nullptr;
        return 0;
    }

    if (!config.output.empty()) {
        LOG_WARNING("-output is ignored for a directory; writing <name>.min.js next to each file");
    }

    std::vector<std::filesystem::path> files;
    try {
        files = listSourceFiles(config.input);
    } catch (const FileError& e) {
        LOG_ERROR(std::string(e.what()));
        return 1;
    }

    BatchMinifier batch(options, config.jobs);
    BatchResult result = batch.run(files);

    std::cout << (config.jsonOutput ? formatJson(result.stats) + "\n" : formatText(result.stats));

    if (!result.ok()) {
        LOG_ERROR(std::to_string(result.failures.size()) + " of " + std::to_string(files.size()) + " files failed");
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = parseCommandLine(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    }

    if (config.showHelp) {
        std::cout << usage(argv[0]);
        return 0;
    }

    common::LogLevel level = config.logLevel;
    if (config.debug && level > common::LogLevel::DEBUG) {
        level = common::LogLevel::DEBUG;
    }
    common::Logger::getInstance().init(level, true, config.logFile);

    minifier::MinifyOptions options = config.minifyOptions();
    if (config.debug) {
        options.stageObserver = [](const std::string& stage, const std::string& buffer) {
            LOG_DEBUG_STREAM("[" << stage << "] " << buffer.size() << " bytes: " << buffer);
        };
    }

    std::error_code ec;
    auto status = std::filesystem::status(config.input, ec);
    if (ec || !std::filesystem::exists(status)) {
        LOG_ERROR("Error accessing input path: " + config.input + (ec ? " (" + ec.message() + ")" : ""));
        return 1;
    }

    if (std::filesystem::is_directory(status)) {
        return runDirectory(config, options);
    }

    if (config.watch) {
        LOG_WARNING("-watch needs a directory; minifying " + config.input + " once");
    }
    return runSingleFile(config, options);
}
