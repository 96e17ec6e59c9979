// MATEICO - Time Utilities
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Provides the ledger clock:
// - Unix timestamps
// - Time formatting and parsing
// - Mock time for testing and for replaying commands at a fixed instant

#ifndef MATEICO_UTIL_TIME_H
#define MATEICO_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mateico {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds (mock time if enabled)
int64_t GetTime();

/// Convert Unix timestamp to system time point
SystemTimePoint FromUnixTime(int64_t timestamp);

/// Convert system time point to Unix timestamp
int64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Time Formatting
// ============================================================================

/// Format Unix timestamp as ISO 8601 string (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Format duration as human-readable string (e.g., "7d 0h 0m 0s")
std::string FormatDuration(int64_t seconds);

/// Parse a timestamp given either as integer Unix seconds or as
/// ISO 8601 "YYYY-MM-DDTHH:MM:SSZ"
std::optional<int64_t> ParseTimestamp(const std::string& str);

/// Parse a duration such as "90", "90s", "15m", "12h", "7d" or "2w"
std::optional<int64_t> ParseDuration(const std::string& str);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time mode
void EnableMockTime();

/// Disable mock time mode
void DisableMockTime();

/// Check if mock time is enabled
bool IsMockTimeEnabled();

/// Set mock time (only works if mock time is enabled)
void SetMockTime(int64_t timestamp);

/// Advance mock time by a number of seconds
void AdvanceMockTime(int64_t seconds);

/// Get mock time (returns 0 if not enabled)
int64_t GetMockTime();

/// RAII guard: enables mock time at a given instant and restores the
/// previous clock mode on destruction
class ScopedMockTime {
public:
    explicit ScopedMockTime(int64_t timestamp);
    ~ScopedMockTime();

    ScopedMockTime(const ScopedMockTime&) = delete;
    ScopedMockTime& operator=(const ScopedMockTime&) = delete;

private:
    bool wasEnabled_;
    int64_t previous_;
};

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 604800;

} // namespace util
} // namespace mateico

#endif // MATEICO_UTIL_TIME_H
