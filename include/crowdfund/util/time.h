// CROWDFUND - Time Utilities
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Wall-clock helpers and the clock abstraction campaigns read their
// funding window against. Every timestamp is unix seconds in UTC.

#ifndef CROWDFUND_UTIL_TIME_H
#define CROWDFUND_UTIL_TIME_H

#include "crowdfund/core/types.h"

#include <chrono>
#include <optional>
#include <string>

namespace crowdfund {
namespace util {

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 60 * SECONDS_PER_MINUTE;

Timestamp GetTime();
int64_t GetTimeMillis();

/// "2024-01-15T10:30:00Z"
std::string FormatISO8601(Timestamp t);

/**
 * "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS", optionally followed by "Z".
 * Out-of-range fields (month 13, February 30) are rejected.
 */
std::optional<Timestamp> ParseISO8601(const std::string& str);

/// Decimal unix seconds, or anything ParseISO8601 accepts
std::optional<Timestamp> ParseTimestamp(const std::string& str);

/// Largest units first, zero parts left out: "1d 2h 4s", "-1m", "0s"
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Clocks
// ============================================================================

/// Time source injected into a campaign
class Clock {
public:
    virtual ~Clock() = default;

    virtual Timestamp Now() const = 0;
};

/// Wall clock
class SystemClock : public Clock {
public:
    Timestamp Now() const override { return GetTime(); }
};

/// Only moves when told to; drives tests and simulator scripts
class MockClock : public Clock {
public:
    explicit MockClock(Timestamp start = 0) : now_(start) {}

    Timestamp Now() const override { return now_; }

    void Set(Timestamp t) { now_ = t; }
    void Advance(int64_t seconds) { now_ += seconds; }

private:
    Timestamp now_;
};

} // namespace util
} // namespace crowdfund

#endif // CROWDFUND_UTIL_TIME_H
