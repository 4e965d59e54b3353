// AGORA - Time Utilities Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/util/time.h>

#include <iomanip>
#include <sstream>

namespace agora {
namespace util {

// ============================================================================
// Unix Timestamps
// ============================================================================

Timestamp GetTimeMillis() {
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

// ============================================================================
// Clocks
// ============================================================================

Timestamp SystemClock::Now() const {
    Timestamp now = GetTimeMillis();
    std::lock_guard<std::mutex> lock(mutex_);
    if (now < last_) {
        return last_;
    }
    last_ = now;
    return now;
}

Timestamp MockClock::Now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

bool MockClock::Set(Timestamp t) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (t < now_) {
        return false;
    }
    now_ = t;
    return true;
}

bool MockClock::Advance(Duration d) {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp next;
    if (!CheckedAdd(now_, d, next)) {
        return false;
    }
    now_ = next;
    return true;
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatDurationMillis(Duration millis) {
    if (millis == 0) {
        return "0s";
    }

    uint64_t totalSeconds = millis / MILLIS_PER_SECOND;
    uint64_t ms = millis % MILLIS_PER_SECOND;

    uint64_t days = totalSeconds / SECONDS_PER_DAY;
    totalSeconds %= SECONDS_PER_DAY;
    uint64_t hours = totalSeconds / SECONDS_PER_HOUR;
    totalSeconds %= SECONDS_PER_HOUR;
    uint64_t minutes = totalSeconds / SECONDS_PER_MINUTE;
    uint64_t seconds = totalSeconds % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";

    if (seconds > 0 || ms > 0) {
        oss << seconds;
        if (ms > 0) {
            oss << '.' << std::setfill('0') << std::setw(3) << ms;
        }
        oss << "s";
    }

    std::string result = oss.str();
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

} // namespace util
} // namespace agora
