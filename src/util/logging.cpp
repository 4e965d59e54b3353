// AGORA - Logging Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/util/logging.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

namespace agora {
namespace util {

// ============================================================================
// Levels
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> LogLevelFromString(const std::string& str) {
    std::string name = str;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (name == "WARNING") {
        return LogLevel::Warn;
    }
    for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                           LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
        if (name == LogLevelToString(level)) {
            return level;
        }
    }
    return std::nullopt;
}

// ============================================================================
// ConsoleSink
// ============================================================================

std::string ConsoleSink::Format(const LogEntry& entry) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << std::setfill(' ')
        << ' ' << std::left << std::setw(5) << LogLevelToString(entry.level);
    if (entry.category != LogCategory::DEFAULT) {
        oss << " [" << entry.category << "]";
    }
    oss << ' ' << entry.message;
    return oss.str();
}

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line = Format(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", line.c_str());
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    sinks_.push_back(std::make_shared<ConsoleSink>());
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file;
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        if (level >= sink->GetLevel()) {
            sink->Write(entry);
        }
    }
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace agora
