#include "jsminify/driver/CommandLine.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace jsminify::driver {

namespace {

constexpr const char* LOG_LEVEL_ENV = "JSMINIFY_LOG_LEVEL";

bool parseBool(const std::string& name, const std::string& value) {
    if (value == "true" || value == "1") return true;
    if (value == "false" || value == "0") return false;
    throw UsageError("Invalid boolean value \"" + value + "\" for -" + name);
}

size_t parseCount(const std::string& name, const std::string& value) {
    bool digits = !value.empty() && value.size() <= 9 &&
                  std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits) {
        throw UsageError("Invalid number \"" + value + "\" for -" + name);
    }
    return static_cast<size_t>(std::stoul(value));
}

common::LogLevel parseLogLevel(const std::string& value) {
    auto level = common::Logger::levelFromString(value);
    if (!level) {
        throw UsageError("Invalid log level \"" + value + "\" (expected TRACE, DEBUG, INFO, WARNING, ERROR or NONE)");
    }
    return *level;
}

} // namespace

minifier::MinifyOptions AppConfig::minifyOptions() const {
    minifier::MinifyOptions options;
    options.preserveLicense = preserveLicense;
    options.shortenVariables = shortenVariables;
    return options;
}

AppConfig parseCommandLine(const std::vector<std::string>& args) {
    AppConfig config;

    if (const char* env = std::getenv(LOG_LEVEL_ENV)) {
        // A bad environment value is ignored; the flag can still override it
        if (auto level = common::Logger::levelFromString(env)) {
            config.logLevel = *level;
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() < 2 || arg[0] != '-') {
            throw UsageError("Unexpected argument: " + arg);
        }

        std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
        std::optional<std::string> inlineValue;
        if (auto eq = name.find('='); eq != std::string::npos) {
            inlineValue = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        auto flag = [&](bool& target) {
            target = inlineValue ? parseBool(name, *inlineValue) : true;
        };
        auto value = [&]() -> std::string {
            if (inlineValue) return *inlineValue;
            if (i + 1 >= args.size()) {
                throw UsageError("Missing value for -" + name);
            }
            return args[++i];
        };

        if (name == "input") {
            config.input = value();
        } else if (name == "output") {
            config.output = value();
        } else if (name == "watch") {
            flag(config.watch);
        } else if (name == "preserve-license") {
            flag(config.preserveLicense);
        } else if (name == "shorten-vars") {
            flag(config.shortenVariables);
        } else if (name == "json") {
            flag(config.jsonOutput);
        } else if (name == "jobs") {
            config.jobs = parseCount(name, value());
        } else if (name == "interval") {
            size_t ms = parseCount(name, value());
            if (ms == 0) {
                throw UsageError("-interval must be greater than zero");
            }
            config.watchInterval = std::chrono::milliseconds(ms);
        } else if (name == "log-level") {
            config.logLevel = parseLogLevel(value());
        } else if (name == "log-file") {
            config.logFile = value();
        } else if (name == "debug") {
            flag(config.debug);
        } else if (name == "help" || name == "h") {
            flag(config.showHelp);
        } else {
            throw UsageError("Unknown flag: " + arg);
        }
    }

    if (!config.showHelp && config.input.empty()) {
        throw UsageError("Please provide an input file or directory using -input");
    }
    return config;
}

AppConfig parseCommandLine(int argc, const char* const argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseCommandLine(args);
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " -input <file|dir> [options]\n"
        << "\n"
        << "Options:\n"
        << "  -input <path>        JavaScript file or directory to minify\n"
        << "  -output <path>       Output file (single file only, default <name>.min.js)\n"
        << "  -watch               Watch the directory and minify files as they change\n"
        << "  -preserve-license    Keep a leading /*! ... */ comment\n"
        << "  -shorten-vars        Rename var/let/const bindings to short names\n"
        << "  -json                Print statistics as JSON\n"
        << "  -jobs <n>            Worker threads for a directory (default: CPU count)\n"
        << "  -interval <ms>       Watch polling interval (default: 1000)\n"
        << "  -log-level <level>   TRACE, DEBUG, INFO, WARNING, ERROR or NONE (env " << LOG_LEVEL_ENV << ")\n"
        << "  -log-file <path>     Also append log lines to this file\n"
        << "  -debug               Log the output of every pipeline stage\n"
        << "  -help                Show this message\n";
    return oss.str();
}

} // namespace jsminify::driver
