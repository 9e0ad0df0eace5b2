// VINDEX - Time Utilities
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Millisecond Unix timestamps, formatting, and a mock clock for testing.

#ifndef VINDEX_UTIL_TIME_H
#define VINDEX_UTIL_TIME_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace vindex {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Milliseconds = std::chrono::milliseconds;

using SystemClock = std::chrono::system_clock;
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = std::chrono::steady_clock::time_point;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t MILLIS_PER_SECOND = 1000;
constexpr int64_t MILLIS_PER_MINUTE = 60 * MILLIS_PER_SECOND;
constexpr int64_t MILLIS_PER_HOUR = 60 * MILLIS_PER_MINUTE;
constexpr int64_t MILLIS_PER_DAY = 24 * MILLIS_PER_HOUR;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in milliseconds (ledger timestamps use this)
int64_t GetTimeMillis();

// ============================================================================
// Formatting
// ============================================================================

/// Format as ISO 8601 UTC with milliseconds (2024-01-02T03:04:05.678Z)
std::string FormatISO8601Millis(int64_t timestampMs);

/// Format a millisecond duration as "1d 2h 3m 4.5s"
std::string FormatDurationMillis(int64_t durationMs);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time mode; the clock freezes at the current time
void EnableMockTime();

/// Disable mock time mode
void DisableMockTime();

/// Check if mock time is enabled
bool IsMockTimeEnabled();

/// Set mock time in milliseconds since epoch
void SetMockTimeMillis(int64_t timestampMs);

/// Advance mock time by duration
void AdvanceMockTime(Milliseconds duration);

/// Get mock time in milliseconds (0 if never set)
int64_t GetMockTimeMillis();

// ============================================================================
// Timer
// ============================================================================

/// Steady-clock stopwatch
class Timer {
public:
    Timer() : start_(SteadyClock::now()) {}

    void Reset() { start_ = SteadyClock::now(); }

    int64_t ElapsedMillis() const {
        return std::chrono::duration_cast<Milliseconds>(
            SteadyClock::now() - start_).count();
    }

private:
    SteadyTimePoint start_;
};

} // namespace util
} // namespace vindex

#endif // VINDEX_UTIL_TIME_H
