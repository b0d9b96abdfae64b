#include "logger.hpp"

#include <ctime>
#include <iostream>

std::atomic<LogLevel> Logger::current_level_{LogLevel::ERROR};
std::atomic<bool> Logger::show_timestamp_{false};
thread_local const char* Logger::thread_role_ = nullptr;
std::ofstream Logger::file_;
std::mutex Logger::mutex_;

bool Logger::setOutputFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.close();
    file_.clear();
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::setThreadRole(const char* role) {
    thread_role_ = role;
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

std::string Logger::formatLine(LogLevel level, const std::string& message,
                               const char* file, int line) {
    std::ostringstream oss;

    if (show_timestamp_.load(std::memory_order_relaxed)) {
        time_t now = time(nullptr);
        struct tm tm_buf;
        char buf[32];
        localtime_r(&now, &tm_buf);
        strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
        oss << "[" << buf << "] ";
    }

    oss << "[" << levelToString(level) << "] ";

    if (thread_role_ != nullptr) {
        oss << "[" << thread_role_ << "] ";
    }

    if (file != nullptr) {
        oss << file << ":" << line << " - ";
    }

    oss << message << "\n";
    return oss.str();
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    if (!isEnabled(level)) {
        return;
    }

    std::string text = formatLine(level, message, file, line);

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << text << std::flush;
    } else if (level >= LogLevel::ERROR) {
        std::cerr << text << std::flush;
    } else {
        std::cout << text << std::flush;
    }
}
