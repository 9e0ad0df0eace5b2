// VINDEX - Time Utilities Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/util/time.h"

#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace vindex {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTimeMillis{0};
    std::mutex g_mockTimeMutex;

    int64_t RealTimeMillis() {
        return std::chrono::duration_cast<Milliseconds>(
            SystemClock::now().time_since_epoch()).count();
    }
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTimeMillis.load();
    }
    return RealTimeMillis();
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601Millis(int64_t timestampMs) {
    auto time = SystemClock::to_time_t(SystemClock::time_point{Milliseconds{timestampMs}});
    int64_t ms = timestampMs % MILLIS_PER_SECOND;
    if (ms < 0) ms += MILLIS_PER_SECOND;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time);
#else
    gmtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::string FormatDurationMillis(int64_t durationMs) {
    if (durationMs < 0) {
        return "-" + FormatDurationMillis(-durationMs);
    }
    if (durationMs == 0) {
        return "0s";
    }

    int64_t days = durationMs / MILLIS_PER_DAY;
    durationMs %= MILLIS_PER_DAY;
    int64_t hours = durationMs / MILLIS_PER_HOUR;
    durationMs %= MILLIS_PER_HOUR;
    int64_t minutes = durationMs / MILLIS_PER_MINUTE;
    durationMs %= MILLIS_PER_MINUTE;
    int64_t seconds = durationMs / MILLIS_PER_SECOND;
    int64_t millis = durationMs % MILLIS_PER_SECOND;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (seconds > 0 || millis > 0) {
        oss << seconds;
        if (millis > 0) {
            oss << '.' << std::setfill('0') << std::setw(3) << millis;
        }
        oss << "s";
    }

    std::string result = oss.str();
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTimeMillis.load() == 0) {
        g_mockTimeMillis.store(RealTimeMillis());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
    g_mockTimeMillis.store(0);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTimeMillis(int64_t timestampMs) {
    g_mockTimeMillis.store(timestampMs);
}

void AdvanceMockTime(Milliseconds duration) {
    g_mockTimeMillis.fetch_add(duration.count());
}

int64_t GetMockTimeMillis() {
    return g_mockTimeMillis.load();
}

} // namespace util
} // namespace vindex
