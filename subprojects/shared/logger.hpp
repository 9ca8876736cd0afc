#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <optional>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <cctype>
#include <climits>
#include <cstdint>

// Fix Windows macro conflicts
#ifdef min
#undef min
#endif
#ifdef max
#undef max
#endif

// Usage:
//   auto logger = std::make_shared<Logger>("cortex-worker");
//   logger->add_sink(std::make_shared<StdoutSink>());
//   auto thread_logger = logger->child("host:echo_service:00");
//   thread_logger->info("requesting task");
// Child loggers share their parent's sinks; every sink serialises its own writes,
// so one sink may be fed from all pool threads.

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

/// Case-insensitive parse of "debug", "info", "warning"/"warn", "error", "critical".
inline std::optional<LogLevel> parse_log_level(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    return std::nullopt;
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, const std::string& source, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

protected:
    LogLevel min_level_ = LogLevel::Info; // Default level set to INFO

    static std::string format_line(LogLevel level, const std::string& source, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << to_string(level) << "] ";
        if (!source.empty()) oss << source << ": ";
        oss << message;
        return oss.str();
    }
};

class StdoutSink : public LogSink {
public:
    void log(LogLevel level, const std::string& source, const std::string& message) override {
        if (level < min_level_) return;
        const std::string line = format_line(level, source, message);
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[" << timestamp() << "] " << line << std::endl;
    }

private:
    static std::string timestamp() {
        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &now);
#else
        localtime_r(&now, &local);
#endif
        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    std::mutex mutex_;
};

class VectorSink : public LogSink {
public:
    void log(LogLevel level, const std::string& source, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(format_line(level, source, message));
        levels_.push_back(level);
    }
    std::vector<std::string> get_lines(size_t start = 0, size_t count = SIZE_MAX, LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> filtered;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (levels_[i] >= min_level) {
                filtered.push_back(lines_[i]);
            }
        }
        if (start >= filtered.size()) return {};
        size_t end = count > filtered.size() - start ? filtered.size() : start + count;
        return std::vector<std::string>(filtered.begin() + start, filtered.begin() + end);
    }
    // Number of lines logged at or above `min_level`
    size_t count(LogLevel min_level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(levels_.begin(), levels_.end(),
                                                 [min_level](LogLevel l) { return l >= min_level; }));
    }
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }
private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
};

class Logger {
public:
    Logger() : name_("Default") {}

    Logger(const std::string& name) : name_(name) {}

    void add_sink(std::shared_ptr<LogSink> sink) {
        sinks_.push_back(std::move(sink));
    }

    /// New logger with the given name writing to the same sinks.
    std::shared_ptr<Logger> child(const std::string& name) const {
        auto logger = std::make_shared<Logger>(name);
        logger->sinks_ = sinks_;
        return logger;
    }

    void log(LogLevel level, const std::string& message) {
        for (const auto& sink : sinks_) {
            sink->log(level, name_, message);
        }
    }

    void debug(const std::string& message)    { log(LogLevel::Debug, message); }
    void info(const std::string& message)     { log(LogLevel::Info, message); }
    void warning(const std::string& message)  { log(LogLevel::Warning, message); }
    void error(const std::string& message)    { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    const std::string& name() const { return name_; }

    void set_name(const std::string& name) { name_ = name; }

    std::vector<std::string> get_lines(int start = 0, int count = INT_MAX, LogLevel min_level = LogLevel::Debug) const {
        for (const auto& sink : sinks_) {
            auto vector_sink = std::dynamic_pointer_cast<VectorSink>(sink);
            if (vector_sink) {
                return vector_sink->get_lines(static_cast<size_t>(start), static_cast<size_t>(count), min_level);
            }
        }
        return {};
    }

private:
    std::string name_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};
