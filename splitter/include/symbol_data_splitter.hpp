#pragma once

#include <optional>
#include <vector>

#include "datatypes.hpp"

namespace splitter {

    struct SplitterOptions {
        int days_per_split = 0;                         // <= 0 produces a single part
        std::size_t warmup_candles_count = 0;
        core::Timestamp backtesting_start;
        bool correct_end_index = false;                 // Align end indexes on an exhausted sibling timeframe
        std::optional<core::Interval> warmup_timeframe; // Resolved from the data when empty
    };

    // Partitions full-history symbol data into sequential parts of days_per_split days.
    // Every emitted timeframe holds copies of candles [start_index, end_index] with the
    // cursors re-based to 0; the input is never modified.
    class SymbolDataSplitter {
    public:
        explicit SymbolDataSplitter(SplitterOptions options);

        // Throws core::InvalidInputException for unsorted or empty input and
        // core::DuplicateDataException for repeated symbols or intervals.
        std::vector<core::Part> split(const std::vector<core::SymbolData>& symbols_data);

        // Warmup timeframe used by the last split() with splitting enabled
        std::optional<core::Interval> getWarmupTimeframe() const { return resolved_warmup_timeframe_; }

        const SplitterOptions& getOptions() const { return options_; }

    private:
        struct Cursor {
            std::size_t start_index = 0;
            std::size_t index = 0;
            std::size_t end_index = 0;
            bool exhausted = false;
        };

        static void validate(const std::vector<core::SymbolData>& symbols_data);
        static void checkDuplicates(const std::vector<core::SymbolData>& symbols_data);

        core::Interval resolveWarmupTimeframe(const std::vector<core::SymbolData>& symbols_data) const;

        // Candle that contains `time`, else the first one opening after it
        static std::optional<std::size_t> findCurrentIndex(const core::TimeSeries<core::Candle>& candles,
                                                           core::Timestamp time);

        std::vector<core::Part> splitWhole(const std::vector<core::SymbolData>& symbols_data) const;
        std::vector<core::Part> splitByDays(const std::vector<core::SymbolData>& symbols_data) const;

        SplitterOptions options_;
        std::optional<core::Interval> resolved_warmup_timeframe_;
    };

} // namespace splitter
