#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace hedging {

namespace {

thread_local std::string t_context;

const char* colorFor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::WARNING: return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::CRITICAL: return "\033[1;31m";
        default: return "";
    }
}

} // namespace

std::unique_ptr<Logger> Logger::instance_ = nullptr;
std::mutex Logger::instance_mutex_;

Logger::Logger(LogLevel level, const std::string& file_path)
    : log_level_(level),
      use_color_(isatty(fileno(stdout)) != 0),
      running_(true) {

    if (!file_path.empty()) {
        log_file_.open(file_path, std::ios::app);
        if (!log_file_.is_open()) {
            std::cerr << "Failed to open log file: " << file_path << std::endl;
        }
    }

    log_thread_ = std::thread(&Logger::processLogs, this);
}

Logger::~Logger() {
    running_ = false;
    log_cv_.notify_all();

    if (log_thread_.joinable()) {
        log_thread_.join();
    }

    // Anything queued after the writer stopped
    drainQueue();
}

void Logger::initialize(LogLevel level, const std::string& file_path) {
    std::unique_ptr<Logger> replacement(new Logger(level, file_path));
    std::unique_ptr<Logger> previous;
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        previous = std::move(instance_);
        instance_ = std::move(replacement);
    }
    // previous is destroyed here, outside the lock, after writing its queue
}

Logger& Logger::getInstance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = std::unique_ptr<Logger>(new Logger(LogLevel::INFO, ""));
    }
    return *instance_;
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::string& file, int line) {
    if (level < log_level_.load()) {
        return;
    }

    LogEntry entry{std::chrono::system_clock::now(), level, message, t_context, file, line};
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        log_queue_.push(std::move(entry));
    }
    log_cv_.notify_one();
}

void Logger::processLogs() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (running_) {
        log_cv_.wait_for(lock, std::chrono::milliseconds(100),
                         [this] { return !log_queue_.empty() || !running_; });

        while (!log_queue_.empty()) {
            LogEntry entry = std::move(log_queue_.front());
            log_queue_.pop();
            writing_ = true;

            lock.unlock();
            writeLog(entry);
            lock.lock();
            writing_ = false;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

void Logger::drainQueue() {
    std::queue<LogEntry> pending;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(pending, log_queue_);
    }
    while (!pending.empty()) {
        writeLog(pending.front());
        pending.pop();
    }
}

std::string Logger::formatEntry(const LogEntry& entry) {
    const auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count()
       << " " << std::setfill(' ') << std::left << std::setw(5) << levelToString(entry.level);

    if (!entry.context.empty()) {
        ss << " {" << entry.context << "}";
    }

    if (!entry.file.empty()) {
        // Basename only
        const size_t last_slash = entry.file.find_last_of("/\\");
        ss << " (" << (last_slash == std::string::npos ? entry.file : entry.file.substr(last_slash + 1))
           << ":" << entry.line << ")";
    }

    ss << " " << entry.message;
    return ss.str();
}

void Logger::writeLog(const LogEntry& entry) {
    const std::string line = formatEntry(entry);

    writeConsole(entry.level, line);

    if (log_file_.is_open()) {
        std::lock_guard<std::mutex> lock(file_mutex_);
        log_file_ << line << '\n';
    }
}

void Logger::writeConsole(LogLevel level, const std::string& line) {
    // Errors go to stderr so result tables on stdout stay clean
    std::ostream& os = level >= LogLevel::ERROR ? std::cerr : std::cout;

    std::lock_guard<std::mutex> lock(console_mutex_);
    const char* color = use_color_ ? colorFor(level) : "";
    if (*color != '\0') {
        os << color << line << "\033[0m" << std::endl;
    } else {
        os << line << std::endl;
    }
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;

    throw std::invalid_argument("Unknown log level: " + name);
}

void Logger::setLogLevel(LogLevel level) {
    log_level_ = level;
}

void Logger::flush() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        log_cv_.notify_one();
        idle_cv_.wait(lock, [this] {
            return (log_queue_.empty() && !writing_) || !running_;
        });
    }

    std::lock_guard<std::mutex> lock(file_mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
    }
}

void Logger::setThreadContext(const std::string& context) {
    t_context = context;
}

const std::string& Logger::threadContext() {
    return t_context;
}

LogContext::LogContext(const std::string& context) : previous_(Logger::threadContext()) {
    Logger::setThreadContext(context);
}

LogContext::~LogContext() {
    Logger::setThreadContext(previous_);
}

PerformanceLogger::PerformanceLogger(const std::string& operation)
    : operation_(operation),
      start_time_(std::chrono::steady_clock::now()) {}

PerformanceLogger::~PerformanceLogger() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time_);

    std::ostringstream ss;
    ss << "Performance: " << operation_ << " took " << elapsed.count() << " us";
    LOG_DEBUG(ss.str());
}

} // namespace hedging
