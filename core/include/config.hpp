#pragma once

#include "datatypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace core {

    using json = nlohmann::json;

    enum class DataSource {
        Synthetic, // Generated random-walk history
        Sqlite     // historical_candles table of a SQLite file
    };

    struct BacktestConfig {
        // --- Splitter ---
        Timestamp backtesting_start;
        int days_per_split = 0;                    // <= 0 disables splitting
        std::size_t warmup_candles_count = 0;
        bool correct_end_index = false;
        std::optional<Interval> warmup_timeframe;  // Resolved automatically when empty

        // --- Engine ---
        bool sort_descending = true;               // Most recent candle first in each window
        bool use_full_candle_for_current = false;  // Disables current-candle masking

        // --- History ---
        DataSource data_source = DataSource::Synthetic;
        std::string database_path;
        std::optional<Timestamp> history_start;    // Defaults to backtesting_start
        std::optional<Timestamp> history_end;
        std::vector<std::string> symbols;
        std::vector<Interval> intervals;           // Sorted ascending after loading
        std::size_t synthetic_candles_count = 1000;
        unsigned long long synthetic_seed = 42;

        // --- Logging ---
        std::string log_level = "info";
    };

    // Throws ConfigException on missing required keys or invalid values
    BacktestConfig parseBacktestConfig(const json& config);

    // Reads and parses a JSON file. Throws ConfigException when unreadable or invalid.
    BacktestConfig loadBacktestConfig(const std::string& path);

} // namespace core
