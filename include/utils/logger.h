#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace hedging {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

// Asynchronous process-wide logger. Entries are queued by the caller and
// written to console and file by a background thread. Each entry carries the
// scenario context of the thread that logged it.
class Logger {
public:
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Replaces the current instance; entries queued on the old one are written first
    static void initialize(LogLevel level, const std::string& file_path);
    static Logger& getInstance();

    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const { return log_level_.load(); }
    // Blocks until the writer thread has written every entry queued so far
    void flush();

    static std::string levelToString(LogLevel level);
    // Accepts debug, info, warning/warn, error, critical (case-insensitive)
    static LogLevel parseLevel(const std::string& name);

    // Context tag for entries logged from the calling thread ("" = none)
    static void setThreadContext(const std::string& context);
    static const std::string& threadContext();

private:
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string context;
        std::string file;
        int line;
    };

    Logger(LogLevel level, const std::string& file_path);

    static std::string formatEntry(const LogEntry& entry);

    void processLogs();
    void drainQueue();
    void writeLog(const LogEntry& entry);
    void writeConsole(LogLevel level, const std::string& line);

    std::atomic<LogLevel> log_level_;
    std::ofstream log_file_;
    bool use_color_;

    std::queue<LogEntry> log_queue_;
    std::mutex queue_mutex_;
    std::mutex console_mutex_;
    std::mutex file_mutex_;
    std::condition_variable log_cv_;
    std::condition_variable idle_cv_;
    bool writing_ = false;  // writer holds a popped entry; guarded by queue_mutex_
    std::atomic<bool> running_;
    std::thread log_thread_;

    static std::unique_ptr<Logger> instance_;
    static std::mutex instance_mutex_;
};

// Tags every entry logged by this thread until the guard goes out of scope
class LogContext {
public:
    explicit LogContext(const std::string& context);
    ~LogContext();

    LogContext(const LogContext&) = delete;
    LogContext& operator=(const LogContext&) = delete;

private:
    std::string previous_;
};

// Convenience macros
#define LOG_DEBUG(msg) ::hedging::Logger::getInstance().log(::hedging::LogLevel::DEBUG, msg, __FILE__, __LINE__)
#define LOG_INFO(msg) ::hedging::Logger::getInstance().log(::hedging::LogLevel::INFO, msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) ::hedging::Logger::getInstance().log(::hedging::LogLevel::WARNING, msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) ::hedging::Logger::getInstance().log(::hedging::LogLevel::ERROR, msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) ::hedging::Logger::getInstance().log(::hedging::LogLevel::CRITICAL, msg, __FILE__, __LINE__)

// Scoped wall-clock timing, reported at DEBUG
class PerformanceLogger {
public:
    explicit PerformanceLogger(const std::string& operation);
    ~PerformanceLogger();

private:
    std::string operation_;
    std::chrono::steady_clock::time_point start_time_;
};

#define PERF_LOG(operation) ::hedging::PerformanceLogger _perf_logger(operation)

} // namespace hedging
