#include "jsminify/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace jsminify::common {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : logLevel(LogLevel::INFO), logToConsole(true), logToFile(false) {
}

Logger::~Logger() {
    close();
}

void Logger::init(LogLevel level, bool enableConsoleLogging, const std::string& logFilePath) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel = level;
    this->logToConsole = enableConsoleLogging;

    if (logFile.is_open()) {
        logFile.close();
    }

    if (!logFilePath.empty()) {
        logFile.open(logFilePath, std::ios::out | std::ios::app);
        logToFile = logFile.is_open();
        if (!logToFile) {
            std::cerr << "[WARN] Could not open log file: " << logFilePath << std::endl;
        }
    } else {
        logToFile = false;
    }
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel = level;
}

bool Logger::isEnabled(LogLevel level) const {
    return level >= logLevel.load();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex);
    std::string output = "[" + levelToString(level) + "] " + message;

    if (logToConsole) {
        std::cerr << output << std::endl;
    }

    if (logToFile && logFile.is_open()) {
        logFile << output << std::endl;
        logFile.flush();
    }
}

void Logger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERR, message);
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex);
    if (logFile.is_open()) {
        logFile.close();
    }
    logToFile = false;
}

std::optional<LogLevel> Logger::levelFromString(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERR;
    if (upper == "NONE") return LogLevel::NONE;
    return std::nullopt;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERR: return "ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace jsminify::common
