#pragma once

#include "datatypes.hpp"
#include <optional>
#include <cstddef>

namespace core {
namespace candles {

    struct HighLow {
        double high = 0.0;
        double low = 0.0;
    };

    // First candle with open_time >= target, or nullopt when every candle opens earlier.
    // Candles must be ascending by open time.
    std::optional<std::size_t> findFirstByOpenTime(const TimeSeries<Candle>& candles, Timestamp target);

    // First candle with close_time >= target, or nullopt when every candle closes earlier
    std::optional<std::size_t> findFirstByCloseTime(const TimeSeries<Candle>& candles, Timestamp target);

    // index - warmup, clamped at the beginning of the history
    inline std::size_t warmupStartIndex(std::size_t index, std::size_t warmup) {
        return index > warmup ? index - warmup : 0;
    }

    // Extends seed with the highs and lows of candles [first, last). An empty range returns seed.
    HighLow rangeHighLow(const TimeSeries<Candle>& candles, std::size_t first, std::size_t last, HighLow seed);

    // Owned copy of candles [first, last], inclusive
    TimeSeries<Candle> copyRange(const TimeSeries<Candle>& candles, std::size_t first, std::size_t last);

} // namespace candles
} // namespace core
