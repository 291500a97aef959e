#include "utils.hpp"
#include "exceptions.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>
#include <string>
#include <cmath>      // For std::pow
#include <cctype>
#include <ctime>
#include <array>
#include <utility>

namespace core {
namespace utils {

    namespace {

        time_t toUtcEpoch(std::tm& tm) {
            // timegm interprets struct tm as UTC. Use _mkgmtime on Windows.
            #ifdef _WIN32
                return _mkgmtime(&tm);
            #else
                return timegm(&tm);
            #endif
        }

        const std::array<std::pair<Interval, const char*>, 15> kIntervalNames = {{
            {Interval::OneMinute, "1m"},
            {Interval::ThreeMinutes, "3m"},
            {Interval::FiveMinutes, "5m"},
            {Interval::FifteenMinutes, "15m"},
            {Interval::ThirtyMinutes, "30m"},
            {Interval::OneHour, "1h"},
            {Interval::TwoHours, "2h"},
            {Interval::FourHours, "4h"},
            {Interval::SixHours, "6h"},
            {Interval::EightHours, "8h"},
            {Interval::TwelveHours, "12h"},
            {Interval::OneDay, "1d"},
            {Interval::ThreeDays, "3d"},
            {Interval::OneWeek, "1w"},
            {Interval::OneMonth, "1M"},
        }};

    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Optional timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                    throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        }

        time_t tt = toUtcEpoch(tm);
        if (tt == static_cast<time_t>(-1)) {
            throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);

        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    Timestamp makeTimestamp(int year, int month, int day, int hour, int minute, int second) {
        std::tm tm = {};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        return std::chrono::system_clock::from_time_t(toUtcEpoch(tm));
    }

    std::string intervalToString(Interval interval) {
        for (const auto& entry : kIntervalNames) {
            if (entry.first == interval) {
                return entry.second;
            }
        }
        return std::to_string(static_cast<std::int64_t>(interval)) + "s";
    }

    Interval intervalFromString(const std::string& value) {
        // Case matters: "1m" is a minute, "1M" a month
        for (const auto& entry : kIntervalNames) {
            if (value == entry.second) {
                return entry.first;
            }
        }
        throw ConfigException("Unknown interval string: " + value);
    }

} // namespace utils
} // namespace core
