#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Formats as ISO 8601 in UTC, e.g. 2023-01-01T03:06:50Z
    std::string timestampToString(const Timestamp& ts);

    // Parses ISO 8601 with optional fractional seconds and an optional Z / +HH:MM offset.
    // A missing offset is read as UTC.
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Builds a UTC timestamp from calendar fields
    Timestamp makeTimestamp(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

    inline Timestamp addDays(const Timestamp& ts, int days) {
        return ts + std::chrono::hours(24) * days;
    }

    // "1m", "5m", "1h", "1d", "1w", "1M" ...
    std::string intervalToString(Interval interval);
    Interval intervalFromString(const std::string& value);

} // namespace utils
} // namespace core
