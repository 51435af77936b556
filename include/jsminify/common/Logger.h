#pragma once

#include <atomic>
#include <string>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>

namespace jsminify::common {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERR = 4,     // ERROR collides with system macros
    NONE = 5     // No logging
};

class Logger {
public:
    static Logger& getInstance();

    // Initialize the logger. Console output goes to stderr so stdout stays free for reports.
    void init(LogLevel level = LogLevel::INFO, bool enableConsoleLogging = true, const std::string& logFilePath = "");

    void setLogLevel(LogLevel level);

    // Check if a given log level is enabled
    bool isEnabled(LogLevel level) const;

    // Log a message with a specific level
    void log(LogLevel level, const std::string& message);

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Close log file if open
    void close();

    ~Logger();

    LogLevel getLogLevel() const {
        return logLevel.load();
    }

    // Accepts TRACE, DEBUG, INFO, WARNING (or WARN), ERROR, NONE; case-insensitive
    static std::optional<LogLevel> levelFromString(const std::string& name);
    static std::string levelToString(LogLevel level);

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> logLevel;  // read without the lock by isEnabled
    bool logToConsole;
    bool logToFile;
    std::ofstream logFile;
    std::mutex mutex;
};

} // namespace jsminify::common

// Convenience macros for logging
#define LOG_TRACE(message) ::jsminify::common::Logger::getInstance().trace(message)
#define LOG_DEBUG(message) ::jsminify::common::Logger::getInstance().debug(message)
#define LOG_INFO(message) ::jsminify::common::Logger::getInstance().info(message)
#define LOG_WARNING(message) ::jsminify::common::Logger::getInstance().warning(message)
#define LOG_ERROR(message) ::jsminify::common::Logger::getInstance().error(message)

// Stream-style logging macros
#define LOG_TRACE_STREAM(message) { if (::jsminify::common::Logger::getInstance().isEnabled(::jsminify::common::LogLevel::TRACE)) { std::stringstream ss; ss << message; ::jsminify::common::Logger::getInstance().trace(ss.str()); } }
#define LOG_DEBUG_STREAM(message) { if (::jsminify::common::Logger::getInstance().isEnabled(::jsminify::common::LogLevel::DEBUG)) { std::stringstream ss; ss << message; ::jsminify::common::Logger::getInstance().debug(ss.str()); } }
#define LOG_INFO_STREAM(message) { if (::jsminify::common::Logger::getInstance().isEnabled(::jsminify::common::LogLevel::INFO)) { std::stringstream ss; ss << message; ::jsminify::common::Logger::getInstance().info(ss.str()); } }
#define LOG_WARNING_STREAM(message) { if (::jsminify::common::Logger::getInstance().isEnabled(::jsminify::common::LogLevel::WARNING)) { std::stringstream ss; ss << message; ::jsminify::common::Logger::getInstance().warning(ss.str()); } }
#define LOG_ERROR_STREAM(message) { if (::jsminify::common::Logger::getInstance().isEnabled(::jsminify::common::LogLevel::ERR)) { std::stringstream ss; ss << message; ::jsminify::common::Logger::getInstance().error(ss.str()); } }
