// AGORA - Time Utilities
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Provides time-related utilities:
// - Millisecond Unix timestamps
// - Injectable clock interface consumed by the governance engine
// - Mock clock for testing
// - Duration formatting

#ifndef AGORA_UTIL_TIME_H
#define AGORA_UTIL_TIME_H

#include <agora/core/types.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace agora {
namespace util {

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t MILLIS_PER_SECOND = 1000;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in milliseconds
Timestamp GetTimeMillis();

// ============================================================================
// Clock
// ============================================================================

/// Source of the current time. Implementations must never go backwards.
class Clock {
public:
    virtual ~Clock() = default;

    /// Current time in milliseconds since the Unix epoch
    virtual Timestamp Now() const = 0;
};

/// Wall clock. Clamps to the last reported value if the system clock steps back.
class SystemClock : public Clock {
public:
    Timestamp Now() const override;

private:
    mutable std::mutex mutex_;
    mutable Timestamp last_{0};
};

/// Manually driven clock for tests and simulations
class MockClock : public Clock {
public:
    explicit MockClock(Timestamp start = 0) : now_(start) {}

    Timestamp Now() const override;

    /// Set the current time. Returns false (and leaves the clock unchanged)
    /// if the new time is earlier than the current one.
    bool Set(Timestamp t);

    /// Advance the current time. Returns false on overflow.
    bool Advance(Duration d);

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

// ============================================================================
// Formatting
// ============================================================================

/// Format duration with milliseconds (e.g., "1h 23m 45.678s")
std::string FormatDurationMillis(Duration millis);

} // namespace util
} // namespace agora

#endif // AGORA_UTIL_TIME_H
