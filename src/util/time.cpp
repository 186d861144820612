// CROWDFUND - Time Utilities Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/util/time.h"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <ctime>

namespace crowdfund {
namespace util {

namespace {

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return month == 2 && IsLeapYear(year) ? 29 : days[month - 1];
}

struct DurationUnit {
    int64_t seconds;
    char suffix;
};

constexpr DurationUnit DURATION_UNITS[] = {
    {SECONDS_PER_DAY, 'd'},
    {SECONDS_PER_HOUR, 'h'},
    {SECONDS_PER_MINUTE, 'm'},
    {1, 's'},
};

} // namespace

Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601(Timestamp t) {
    std::time_t seconds = static_cast<std::time_t>(t);
    std::tm utc{};
    if (gmtime_r(&seconds, &utc) == nullptr) {
        return std::to_string(t);
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec);
    return buf;
}

std::string FormatDuration(int64_t seconds) {
    if (seconds == 0) {
        return "0s";
    }
    if (seconds < 0) {
        return "-" + FormatDuration(-seconds);
    }

    std::string out;
    for (const DurationUnit& unit : DURATION_UNITS) {
        int64_t count = seconds / unit.seconds;
        seconds %= unit.seconds;
        if (count > 0) {
            if (!out.empty()) out += ' ';
            out += std::to_string(count) + unit.suffix;
        }
    }
    return out;
}

// ============================================================================
// Parsing
// ============================================================================

std::optional<Timestamp> ParseISO8601(const std::string& str) {
    if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int used = 0;
    if (std::sscanf(str.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &used) != 3) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(used);
    if (pos < str.size() && (str[pos] == 'T' || str[pos] == 't')) {
        int timeUsed = 0;
        if (std::sscanf(str.c_str() + pos + 1, "%2d:%2d:%2d%n",
                        &hour, &minute, &second, &timeUsed) != 3) {
            return std::nullopt;
        }
        pos += 1 + static_cast<size_t>(timeUsed);
    }
    if (pos < str.size() && (str[pos] == 'Z' || str[pos] == 'z')) {
        ++pos;
    }
    if (pos != str.size()) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month) ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
        return std::nullopt;
    }

    std::tm utc{};
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;
    return static_cast<Timestamp>(timegm(&utc));
}

std::optional<Timestamp> ParseTimestamp(const std::string& str) {
    const char* begin = str.data();
    const char* end = begin + str.size();

    Timestamp value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (!str.empty() && ptr == end) {
        return ec == std::errc() ? std::optional<Timestamp>(value) : std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        return std::nullopt;
    }
    return ParseISO8601(str);
}

} // namespace util
} // namespace crowdfund
