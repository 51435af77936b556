#pragma once

#include "jsminify/common/Logger.h"
#include "jsminify/minifier/Minifier.h"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace jsminify::driver {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AppConfig {
    std::string input;
    std::string output;
    bool watch = false;
    bool preserveLicense = false;
    bool shortenVariables = false;
    bool jsonOutput = false;
    size_t jobs = 0;    // 0 = one worker per hardware thread
    std::chrono::milliseconds watchInterval{1000};
    common::LogLevel logLevel = common::LogLevel::INFO;
    std::string logFile;
    bool debug = false;  // log each pipeline stage's output
    bool showHelp = false;

    // Engine options; the caller attaches a stage observer if it wants one
    minifier::MinifyOptions minifyOptions() const;
};

/**
 * Parses flags (argv without the program name). Flags take one or two
 * leading dashes and values as "-flag value" or "-flag=value". The log
 * level defaults to $JSMINIFY_LOG_LEVEL when set. Throws UsageError.
 */
AppConfig parseCommandLine(const std::vector<std::string>& args);
AppConfig parseCommandLine(int argc, const char* const argv[]);

std::string usage(const std::string& program);

} // namespace jsminify::driver
