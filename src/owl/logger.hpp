#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

/**
 * Process-wide logger shared by the capture, persistence, live view and
 * main threads.
 *
 * Usage:
 *   Logger::setLevel(LogLevel::INFO);
 *   Logger::setThreadRole("capture");   // once, at the top of a thread
 *   LOG_INFO("Sighting: " << name);
 *
 * Each line reads "[time] [LEVEL] [role] message". The time part is only
 * present with setShowTimestamp(true), the role part only on threads that
 * named themselves. DEBUG and ERROR lines also carry file:line.
 *
 * Lines go to the log file when one is set, otherwise ERROR to stderr and
 * everything else to stdout. LOG_DEBUG compiles to nothing under NDEBUG.
 */

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    NONE = 4  // Disable all logging
};

class Logger {
public:
    static void setLevel(LogLevel level) { current_level_.store(level, std::memory_order_relaxed); }
    static LogLevel getLevel() { return current_level_.load(std::memory_order_relaxed); }

    static void setShowTimestamp(bool show) { show_timestamp_.store(show, std::memory_order_relaxed); }

    // Append all log lines to a file instead of stdout/stderr.
    // Returns false if the file cannot be opened.
    static bool setOutputFile(const std::string& path);

    // Tags every line logged from the calling thread; nullptr clears it
    static void setThreadRole(const char* role);

    static bool isEnabled(LogLevel level) { return level >= getLevel(); }

    static void log(LogLevel level, const std::string& message,
                    const char* file = nullptr, int line = 0);

private:
    static const char* levelToString(LogLevel level);
    static std::string formatLine(LogLevel level, const std::string& message,
                                  const char* file, int line);

    static std::atomic<LogLevel> current_level_;
    static std::atomic<bool> show_timestamp_;
    static thread_local const char* thread_role_;
    static std::ofstream file_;
    static std::mutex mutex_;
};

#define OWL_LOG_AT(level, msg, file, line) \
    do { \
        if (Logger::isEnabled(level)) { \
            std::ostringstream owl_log_oss_; \
            owl_log_oss_ << msg; \
            Logger::log(level, owl_log_oss_.str(), file, line); \
        } \
    } while(0)

#define LOG_DEBUG(msg)   OWL_LOG_AT(LogLevel::DEBUG, msg, __FILE__, __LINE__)
#define LOG_INFO(msg)    OWL_LOG_AT(LogLevel::INFO, msg, nullptr, 0)
#define LOG_WARNING(msg) OWL_LOG_AT(LogLevel::WARNING, msg, nullptr, 0)
#define LOG_ERROR(msg)   OWL_LOG_AT(LogLevel::ERROR, msg, __FILE__, __LINE__)

// Compile-time disable for release builds
#ifdef NDEBUG
#undef LOG_DEBUG
#define LOG_DEBUG(msg) do {} while(0)
#endif

#endif  // LOGGER_HPP
