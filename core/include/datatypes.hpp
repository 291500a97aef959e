#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace core {

    // UTC time points everywhere; conversions live in utils.hpp
    using Timestamp = std::chrono::system_clock::time_point;

    template<typename T>
    using TimeSeries = std::vector<T>;

    // Candle aggregation interval, valued in seconds so that ordering follows granularity
    enum class Interval : std::int64_t {
        OneMinute      = 60,
        ThreeMinutes   = 180,
        FiveMinutes    = 300,
        FifteenMinutes = 900,
        ThirtyMinutes  = 1800,
        OneHour        = 3600,
        TwoHours       = 7200,
        FourHours      = 14400,
        SixHours       = 21600,
        EightHours     = 28800,
        TwelveHours    = 43200,
        OneDay         = 86400,
        ThreeDays      = 259200,
        OneWeek        = 604800,
        OneMonth       = 2592000 // 30 days
    };

    inline std::chrono::seconds intervalDuration(Interval interval) {
        return std::chrono::seconds(static_cast<std::int64_t>(interval));
    }

    struct Candle {
        Timestamp open_time;
        Timestamp close_time;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0;

        bool operator<(const Candle& other) const {
            return open_time < other.open_time;
        }
    };

    // One interval of one symbol plus the replay cursors over it.
    // start_index <= index <= end_index < candles.size() once the splitter has run.
    struct Timeframe {
        Interval interval = Interval::OneMinute;
        std::size_t start_index = 0; // First warmup candle
        std::size_t index = 0;       // Current (still forming) candle
        std::size_t end_index = 0;   // Last candle of the part, inclusive
        bool exhausted = false;      // No history beyond end_index
        TimeSeries<Candle> candles;
    };

    // Timeframes are kept ascending by interval, the finest one first
    struct SymbolData {
        std::string symbol;
        std::vector<Timeframe> timeframes;
    };

    // Time-bounded slice of the full history produced by the splitter
    using Part = std::vector<SymbolData>;

} // namespace core
