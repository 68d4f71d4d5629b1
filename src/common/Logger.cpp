#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <thread>

namespace {

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    localtime_r(&nowTimeT, &tmBuf);

    std::stringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << nowMs.count();
    return ss.str();
}

} // namespace

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
    logLevel.store(level);
    logToConsole = enableConsoleLogging;

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

void Logger::initFromEnvironment(LogLevel fallback) {
    LogLevel level = fallback;
    if (const char* levelEnv = std::getenv("LOG_LEVEL")) {
        level = parseLogLevel(levelEnv, fallback);
    }

    std::string logFilePath;
    if (const char* fileEnv = std::getenv("LOG_FILE")) {
        logFilePath = fileEnv;
    }

    init(level, true, logFilePath);
}

void Logger::setLogLevel(LogLevel level) {
    logLevel.store(level);
}

bool Logger::isEnabled(LogLevel level) const {
    LogLevel current = logLevel.load();
    return current != LogLevel::NONE && level >= current;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::ostringstream threadId;
    threadId << std::this_thread::get_id();

    std::string output = currentTimestamp() + " [" + levelToString(level) + "] [" + threadId.str() + "] " + message;

    std::lock_guard<std::mutex> lock(mutex);
    if (logToConsole) {
        // Warnings and errors go to stderr so report output on stdout stays clean
        if (level >= LogLevel::WARNING) {
            std::cerr << output << std::endl;
        } else {
            std::cout << output << std::endl;
        }
    }

    if (logToFile && logFile.is_open()) {
        logFile << output << std::endl;
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

LogLevel Logger::parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "NONE") return LogLevel::NONE;
    if (upper == "ERROR") return LogLevel::ERR;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "TRACE") return LogLevel::TRACE;
    return fallback;
}

std::string Logger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERR: return "ERROR";
        default: return "UNKNOWN";
    }
}
