#include "config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include "utils.hpp"

#include <algorithm>
#include <fstream>
#include <set>

namespace core {

    namespace {

        Timestamp parseTimestampField(const json& config, const char* key) {
            if (!config[key].is_string()) {
                throw ConfigException(fmt::format("'{}' must be an ISO 8601 string.", key));
            }
            const std::string value = config[key].get<std::string>();
            try {
                return utils::stringToTimestamp(value);
            } catch (const std::exception& e) {
                throw ConfigException(fmt::format("Invalid '{}' value '{}': {}", key, value, e.what()));
            }
        }

        template<typename T>
        T getOr(const json& config, const char* key, T fallback) {
            if (!config.contains(key)) {
                return fallback;
            }
            try {
                return config[key].get<T>();
            } catch (const json::exception& e) {
                throw ConfigException(fmt::format("Invalid type for '{}': {}", key, e.what()));
            }
        }

        DataSource stringToDataSource(const std::string& value) {
            if (value == "synthetic") return DataSource::Synthetic;
            if (value == "sqlite") return DataSource::Sqlite;
            throw ConfigException("Unknown data_source: " + value + " (expected 'synthetic' or 'sqlite')");
        }

    } // end anonymous namespace

    BacktestConfig parseBacktestConfig(const json& config) {
        if (!config.is_object()) {
            throw ConfigException("Backtest config must be a JSON object.");
        }
        if (!config.contains("backtesting_start")) {
            throw ConfigException("Backtest config requires 'backtesting_start'.");
        }

        BacktestConfig result;
        result.backtesting_start = parseTimestampField(config, "backtesting_start");
        result.days_per_split = getOr<int>(config, "days_per_split", 0);

        const long long warmup = getOr<long long>(config, "warmup_candles_count", 0);
        if (warmup < 0) {
            throw ConfigException("'warmup_candles_count' must not be negative.");
        }
        result.warmup_candles_count = static_cast<std::size_t>(warmup);
        result.correct_end_index = getOr<bool>(config, "correct_end_index", false);
        if (config.contains("warmup_timeframe") && !config["warmup_timeframe"].is_null()) {
            result.warmup_timeframe = utils::intervalFromString(getOr<std::string>(config, "warmup_timeframe", ""));
        }

        result.sort_descending = getOr<bool>(config, "sort_descending", true);
        result.use_full_candle_for_current = getOr<bool>(config, "use_full_candle_for_current", false);

        result.data_source = stringToDataSource(getOr<std::string>(config, "data_source", "synthetic"));
        result.database_path = getOr<std::string>(config, "database_path", "");
        if (result.data_source == DataSource::Sqlite && result.database_path.empty()) {
            throw ConfigException("'database_path' is required when data_source is 'sqlite'.");
        }
        if (config.contains("history_start")) {
            result.history_start = parseTimestampField(config, "history_start");
        }
        if (config.contains("history_end")) {
            result.history_end = parseTimestampField(config, "history_end");
        }

        result.symbols = getOr<std::vector<std::string>>(config, "symbols", {});
        if (result.symbols.empty()) {
            throw ConfigException("Backtest config requires a non-empty 'symbols' array.");
        }

        const auto interval_names = getOr<std::vector<std::string>>(config, "intervals", {});
        if (interval_names.empty()) {
            throw ConfigException("Backtest config requires a non-empty 'intervals' array.");
        }
        std::set<Interval> unique_intervals;
        for (const auto& name : interval_names) {
            if (!unique_intervals.insert(utils::intervalFromString(name)).second) {
                throw ConfigException("Interval listed twice: " + name);
            }
        }
        result.intervals.assign(unique_intervals.begin(), unique_intervals.end()); // std::set keeps them ascending

        const long long synthetic_count = getOr<long long>(config, "synthetic_candles_count", 1000);
        if (synthetic_count <= 0) {
            throw ConfigException("'synthetic_candles_count' must be positive.");
        }
        result.synthetic_candles_count = static_cast<std::size_t>(synthetic_count);
        result.synthetic_seed = getOr<unsigned long long>(config, "synthetic_seed", 42ULL);
        result.log_level = getOr<std::string>(config, "log_level", "info");

        return result;
    }

    BacktestConfig loadBacktestConfig(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open backtest config file: {}", path));
        }

        json config;
        try {
            config = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse backtest config file '{}': {}", path, e.what()));
        }
        return parseBacktestConfig(config);
    }

} // namespace core
