// MATEICO - Time Utilities Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/util/time.h"

#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace mateico {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;

    int64_t WallClockSeconds() {
        return std::chrono::duration_cast<Seconds>(
            SystemClock::now().time_since_epoch()).count();
    }

    bool IsDigits(const std::string& str) {
        if (str.empty()) return false;
        for (char c : str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return WallClockSeconds();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint{Seconds{timestamp}};
}

int64_t ToUnixTime(SystemTimePoint tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

// ============================================================================
// Time Formatting
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(int64_t total) {
    if (total < 0) {
        return "-" + FormatDuration(-total);
    }
    if (total == 0) {
        return "0s";
    }

    int64_t days = total / SECONDS_PER_DAY;
    total %= SECONDS_PER_DAY;
    int64_t hours = total / SECONDS_PER_HOUR;
    total %= SECONDS_PER_HOUR;
    int64_t minutes = total / SECONDS_PER_MINUTE;
    int64_t seconds = total % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (seconds > 0) oss << seconds << "s";

    std::string result = oss.str();
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

std::optional<int64_t> ParseTimestamp(const std::string& str) {
    if (IsDigits(str)) {
        try {
            return std::stoll(str);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    std::tm tm_buf = {};
    std::istringstream iss(str);
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    char tail = 0;
    if (iss >> tail && tail != 'Z') {
        return std::nullopt;
    }
    return static_cast<int64_t>(timegm(&tm_buf));
}

std::optional<int64_t> ParseDuration(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    int64_t unit = 1;
    std::string digits = str;
    switch (str.back()) {
        case 's': unit = 1; digits.pop_back(); break;
        case 'm': unit = SECONDS_PER_MINUTE; digits.pop_back(); break;
        case 'h': unit = SECONDS_PER_HOUR; digits.pop_back(); break;
        case 'd': unit = SECONDS_PER_DAY; digits.pop_back(); break;
        case 'w': unit = SECONDS_PER_WEEK; digits.pop_back(); break;
        default: break;
    }
    if (!IsDigits(digits)) {
        return std::nullopt;
    }
    try {
        return std::stoll(digits) * unit;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (!g_mockTimeEnabled.load() && g_mockTime.load() == 0) {
        g_mockTime.store(WallClockSeconds());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(int64_t seconds) {
    g_mockTime.fetch_add(seconds);
}

int64_t GetMockTime() {
    return g_mockTimeEnabled.load() ? g_mockTime.load() : 0;
}

ScopedMockTime::ScopedMockTime(int64_t timestamp)
    : wasEnabled_(IsMockTimeEnabled())
    , previous_(g_mockTime.load()) {
    SetMockTime(timestamp);
    EnableMockTime();
}

ScopedMockTime::~ScopedMockTime() {
    SetMockTime(previous_);
    if (!wasEnabled_) {
        DisableMockTime();
    }
}

} // namespace util
} // namespace mateico
