#pragma once

#include <string>
#include <vector>
#include <optional>

#include <sqlite3.h>

#include "datatypes.hpp"

namespace data {

class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates the historical_candles table and its index when missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // Inserts in a single transaction; rows already stored for the same
    // (symbol, interval, open_time) are ignored
    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& symbol,
                     core::Interval interval);

    // Candles with start_time <= open_time <= end_time, ascending by open time.
    // Throws core::DataLoadException when not connected or the query fails.
    core::TimeSeries<core::Candle> queryCandles(const std::string& symbol,
                                                core::Interval interval,
                                                core::Timestamp start_time,
                                                core::Timestamp end_time);

    // Assembles one SymbolData per symbol with its timeframes ascending by interval.
    // A missing end_time reads to the end of the stored history. Throws
    // core::DataLoadException when a requested series has no candles in range.
    std::vector<core::SymbolData> loadSymbolData(const std::vector<std::string>& symbols,
                                                 const std::vector<core::Interval>& intervals,
                                                 core::Timestamp start_time,
                                                 std::optional<core::Timestamp> end_time = std::nullopt);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
};

} // namespace data
