#pragma once

#include <memory>
#include <mutex>
#include <string>

enum class LogLevel {
    Info,
    Warning,
    Error
};

class Logger {
public:
    explicit Logger(const std::string& logPath, bool verbose = false);

    void log(LogLevel level, const std::string& message) const;
    void info(const std::string& message) const;
    void warn(const std::string& message) const;
    void error(const std::string& message) const;

    void setVerbose(bool verbose);
    const std::string& path() const;

private:
    std::string logPath_;
    bool verbose_{false};
    mutable std::mutex logMutex_;
};

// logger가 없으면 아무것도 하지 않는다
void logTo(const std::shared_ptr<Logger>& logger, LogLevel level, const std::string& message);
