#include "synthetic_history.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <set>
#include <stdexcept>
#include <utility>

namespace data {

    SyntheticHistory::SyntheticHistory(unsigned long long seed, double initial_price, double step_volatility)
        : seed_(seed), initial_price_(initial_price), step_volatility_(step_volatility)
    {
        if (initial_price_ <= 0.0 || step_volatility_ < 0.0) {
            throw std::invalid_argument("SyntheticHistory needs a positive initial price and a non-negative volatility.");
        }
    }

    std::vector<core::SymbolData> SyntheticHistory::generate(const std::vector<std::string>& symbols,
                                                             const std::vector<core::Interval>& intervals,
                                                             core::Timestamp start,
                                                             std::size_t lowest_count) const
    {
        const std::set<core::Interval> sorted_intervals(intervals.begin(), intervals.end());
        if (sorted_intervals.empty()) {
            return {};
        }

        std::vector<core::SymbolData> result;
        result.reserve(symbols.size());
        for (std::size_t s = 0; s < symbols.size(); ++s) {
            core::SymbolData symbol_data;
            symbol_data.symbol = symbols[s];

            const core::Interval lowest = *sorted_intervals.begin();
            core::TimeSeries<core::Candle> base = randomWalk(s, lowest, start, lowest_count);

            for (core::Interval interval : sorted_intervals) {
                core::Timeframe timeframe;
                timeframe.interval = interval;
                timeframe.candles = interval == lowest ? base : aggregate(base, interval, start);
                symbol_data.timeframes.push_back(std::move(timeframe));
            }
            result.push_back(std::move(symbol_data));
        }

        core::logging::getLogger()->info("Generated synthetic history: {} symbols, {} intervals, {} base candles from {} (seed {}).",
                                         symbols.size(), sorted_intervals.size(), lowest_count,
                                         core::utils::timestampToString(start), seed_);
        return result;
    }

    core::TimeSeries<core::Candle> SyntheticHistory::randomWalk(unsigned long long stream, core::Interval interval,
                                                                core::Timestamp start, std::size_t count) const
    {
        std::seed_seq seq{seed_, stream};
        std::mt19937_64 rng(seq);
        std::normal_distribution<double> step(0.0, step_volatility_);
        std::uniform_real_distribution<double> wick(0.0, step_volatility_);
        std::uniform_real_distribution<double> volume(10.0, 1000.0);

        const auto duration = core::intervalDuration(interval);
        const auto last_second = duration - std::chrono::seconds(1);

        core::TimeSeries<core::Candle> candles;
        candles.reserve(count);
        double price = initial_price_;
        for (std::size_t i = 0; i < count; ++i) {
            core::Candle candle;
            candle.open_time = start + duration * static_cast<std::int64_t>(i);
            candle.close_time = candle.open_time + last_second;
            candle.open = price;
            candle.close = price * std::exp(step(rng));
            candle.high = std::max(candle.open, candle.close) * (1.0 + wick(rng));
            candle.low = std::min(candle.open, candle.close) * (1.0 - wick(rng));
            candle.volume = volume(rng);
            candles.push_back(candle);
            price = candle.close;
        }
        return candles;
    }

    core::TimeSeries<core::Candle> SyntheticHistory::aggregate(const core::TimeSeries<core::Candle>& candles,
                                                               core::Interval interval,
                                                               core::Timestamp anchor)
    {
        const auto duration = core::intervalDuration(interval);

        core::TimeSeries<core::Candle> result;
        for (const auto& candle : candles) {
            const auto offset = std::chrono::duration_cast<std::chrono::seconds>(candle.open_time - anchor);
            const core::Timestamp bucket_open = anchor + duration * (offset / duration);

            if (result.empty() || result.back().open_time != bucket_open) {
                core::Candle bar = candle;
                bar.open_time = bucket_open;
                bar.close_time = bucket_open + duration - std::chrono::seconds(1);
                result.push_back(bar);
                continue;
            }

            core::Candle& bar = result.back();
            bar.high = std::max(bar.high, candle.high);
            bar.low = std::min(bar.low, candle.low);
            bar.close = candle.close;
            bar.volume += candle.volume;
        }
        return result;
    }

} // namespace data
