#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp"

namespace data {

    // Deterministic random-walk history. The finest interval is generated directly and
    // every coarser interval is aggregated from it, so all timeframes of a symbol agree.
    class SyntheticHistory {
    public:
        explicit SyntheticHistory(unsigned long long seed, double initial_price = 100.0, double step_volatility = 0.002);

        // `lowest_count` candles of the finest interval starting at `start`; intervals are
        // sorted and deduplicated. Same seed and arguments give identical history.
        std::vector<core::SymbolData> generate(const std::vector<std::string>& symbols,
                                               const std::vector<core::Interval>& intervals,
                                               core::Timestamp start,
                                               std::size_t lowest_count) const;

        // Buckets ascending candles into `interval` bars anchored at `anchor`
        static core::TimeSeries<core::Candle> aggregate(const core::TimeSeries<core::Candle>& candles,
                                                        core::Interval interval,
                                                        core::Timestamp anchor);

    private:
        core::TimeSeries<core::Candle> randomWalk(unsigned long long stream, core::Interval interval,
                                                  core::Timestamp start, std::size_t count) const;

        unsigned long long seed_;
        double initial_price_;
        double step_volatility_;
    };

} // namespace data
