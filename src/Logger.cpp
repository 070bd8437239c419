#include "Logger.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>

#include "Utils.h"

namespace {
const char* levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Info:
    default:
        return "INFO";
    }
}
} // 익명 네임스페이스 종료

Logger::Logger(const std::string& logPath, bool verbose)
    : logPath_(logPath), verbose_(verbose) {
    ensureParentDirectory(logPath_);
}

void Logger::log(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (verbose_ && level != LogLevel::Info) {
        std::cerr << "[EtherBeast] " << message << '\n';
    }

    std::ofstream file(logPath_, std::ios::app);
    if (!file.is_open()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm timeInfo{};

#if defined(_WIN32)
    localtime_s(&timeInfo, &nowTime);
#else
    localtime_r(&nowTime, &timeInfo);
#endif

    file << '[' << std::put_time(&timeInfo, "%F %T") << "] [" << levelToString(level) << "] " << message << '\n';
}

void Logger::info(const std::string& message) const {
    log(LogLevel::Info, message);
}

void Logger::warn(const std::string& message) const {
    log(LogLevel::Warning, message);
}

void Logger::error(const std::string& message) const {
    log(LogLevel::Error, message);
}

void Logger::setVerbose(bool verbose) {
    std::lock_guard<std::mutex> lock(logMutex_);
    verbose_ = verbose;
}

const std::string& Logger::path() const {
    return logPath_;
}

void logTo(const std::shared_ptr<Logger>& logger, LogLevel level, const std::string& message) {
    if (logger) {
        logger->log(level, message);
    }
}
