#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>

namespace TrapWatch {

namespace {
thread_local std::string currentThreadName;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : minLevel_(LogLevel::INFO) {}

Logger::~Logger() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < minLevel_.load()) return;
    
    std::lock_guard<std::mutex> lock(mutex_);

    std::stringstream ss;
    ss << "[" << getCurrentTimestamp() << "] "
       << "[" << levelToString(level) << "] ";
    if (!currentThreadName.empty()) {
        ss << "[" << currentThreadName << "] ";
    }
    ss << message;

    std::string logMsg = ss.str();

    // Warnings and errors go to stderr so service managers can tell them apart
    std::ostream& console = level >= LogLevel::WARNING ? std::cerr : std::cout;
    console << logMsg << std::endl;

    if (logFile_.is_open()) {
        logFile_ << logMsg << std::endl;
        logFile_.flush();
    }
}

void Logger::setLogLevel(LogLevel level) {
    minLevel_ = level;
}

LogLevel Logger::getLogLevel() const {
    return minLevel_.load();
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    if (!filename.empty()) {
        logFile_.open(filename, std::ios::app);
    }
}

void Logger::setThreadName(const std::string& name) {
    currentThreadName = name;
}

std::string Logger::threadName() {
    return currentThreadName;
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);
    
    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace TrapWatch
