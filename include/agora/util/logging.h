// AGORA - Logging System
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Process-wide logger used by the governance engine. Messages are written
// with the LOG_* stream macros, tagged with a category, and fanned out to
// every registered sink whose level admits them.

#ifndef AGORA_UTIL_LOGGING_H
#define AGORA_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace agora {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

/// Upper-case level name ("INFO")
const char* LogLevelToString(LogLevel level);

/// Case-insensitive; accepts "warning" for Warn. nullopt for unknown names.
std::optional<LogLevel> LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* VOTING = "voting";
    constexpr const char* CONFIG = "config";
    constexpr const char* TREASURY = "treasury";
    constexpr const char* DB = "db";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Sinks
// ============================================================================

/**
 * Destination for log entries. The logger only hands a sink entries at or
 * above the sink's own level.
 */
class ILogSink {
public:
    explicit ILogSink(LogLevel level) : level_(level) {}
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

private:
    std::atomic<LogLevel> level_;
};

/// Writes "HH:MM:SS.mmm LEVEL [category] message" lines to stderr.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(LogLevel level = LogLevel::Warn) : ILogSink(level) {}

    void Write(const LogEntry& entry) override;

    static std::string Format(const LogEntry& entry);

private:
    std::mutex mutex_;
};

/// Forwards each entry to a callback. Used to capture logs in tests.
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : ILogSink(level), callback_(std::move(callback)) {}

    void Write(const LogEntry& entry) override {
        if (callback_) {
            callback_(entry);
        }
    }

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * Singleton logger. Starts at Info with a ConsoleSink for warnings and
 * errors; hosts replace the sinks as they see fit.
 */
class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    bool WillLog(LogLevel level) const { return level >= level_.load(); }

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::mutex sinksMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects one message and hands it to the logger when destroyed
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

// The message expression is not evaluated when the level is filtered out
#define AGORA_LOG(level, category) \
    if (!::agora::util::Logger::Instance().WillLog(::agora::util::LogLevel::level)) \
        ; \
    else \
        ::agora::util::LogStream(::agora::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_DEBUG(category)   AGORA_LOG(Debug, category)
#define LOG_INFO(category)    AGORA_LOG(Info, category)
#define LOG_WARN(category)    AGORA_LOG(Warn, category)
#define LOG_ERROR(category)   AGORA_LOG(Error, category)

} // namespace util
} // namespace agora

#endif // AGORA_UTIL_LOGGING_H
