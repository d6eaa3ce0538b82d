#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <atomic>

namespace TrapWatch {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();
    
    void log(LogLevel level, const std::string& message);
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void setLogFile(const std::string& filename);

    // Tags every line logged from the calling thread, e.g. "camera-monitor".
    // An empty name removes the tag.
    static void setThreadName(const std::string& name);
    static std::string threadName();

    // Unknown names map to INFO
    static LogLevel parseLevel(const std::string& name);
    
private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::string getCurrentTimestamp();
    std::string levelToString(LogLevel level);
    
    std::mutex mutex_;
    std::atomic<LogLevel> minLevel_;
    std::ofstream logFile_;
};

} // namespace TrapWatch

#define LOG_DEBUG(msg) ::TrapWatch::Logger::getInstance().log(::TrapWatch::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) ::TrapWatch::Logger::getInstance().log(::TrapWatch::LogLevel::INFO, msg)
#define LOG_WARNING(msg) ::TrapWatch::Logger::getInstance().log(::TrapWatch::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) ::TrapWatch::Logger::getInstance().log(::TrapWatch::LogLevel::ERROR, msg)
