#include "candle_search.hpp"
#include <algorithm>
#include <iterator>

namespace core {
namespace candles {

    std::optional<std::size_t> findFirstByOpenTime(const TimeSeries<Candle>& candles, Timestamp target) {
        auto it = std::lower_bound(candles.begin(), candles.end(), target,
            [](const Candle& candle, const Timestamp& t) { return candle.open_time < t; });
        if (it == candles.end()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(std::distance(candles.begin(), it));
    }

    std::optional<std::size_t> findFirstByCloseTime(const TimeSeries<Candle>& candles, Timestamp target) {
        // Close times ascend together with open times in a well-formed series
        auto it = std::lower_bound(candles.begin(), candles.end(), target,
            [](const Candle& candle, const Timestamp& t) { return candle.close_time < t; });
        if (it == candles.end()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(std::distance(candles.begin(), it));
    }

    HighLow rangeHighLow(const TimeSeries<Candle>& candles, std::size_t first, std::size_t last, HighLow seed) {
        for (std::size_t i = first; i < last; ++i) {
            const Candle& c = candles[i];
            if (c.high > seed.high) seed.high = c.high;
            if (c.low < seed.low) seed.low = c.low;
        }
        return seed;
    }

    TimeSeries<Candle> copyRange(const TimeSeries<Candle>& candles, std::size_t first, std::size_t last) {
        return TimeSeries<Candle>(candles.begin() + static_cast<std::ptrdiff_t>(first),
                                  candles.begin() + static_cast<std::ptrdiff_t>(last) + 1);
    }

} // namespace candles
} // namespace core
