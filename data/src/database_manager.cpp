#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <utility>

namespace data
{

    namespace {

        using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

        const char* kCreateCandlesTable = R"(
            CREATE TABLE IF NOT EXISTS historical_candles (
                symbol     TEXT NOT NULL,
                interval   TEXT NOT NULL,
                open_time  TEXT NOT NULL,
                close_time TEXT NOT NULL,
                open       REAL,
                high       REAL,
                low        REAL,
                close      REAL,
                volume     REAL,
                PRIMARY KEY (symbol, interval, open_time)
            );
        )";

        const char* kCreateCandlesIndex = R"(
            CREATE INDEX IF NOT EXISTS idx_candles_open_time
            ON historical_candles (symbol, interval, open_time);
        )";

        const char* kInsertCandle = R"(
            INSERT OR IGNORE INTO historical_candles
            (symbol, interval, open_time, close_time, open, high, low, close, volume)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9);
        )";

        const char* kSelectCandles = R"(
            SELECT open_time, close_time, open, high, low, close, volume
            FROM historical_candles
            WHERE symbol = ?1 AND interval = ?2 AND open_time BETWEEN ?3 AND ?4
            ORDER BY open_time ASC;
        )";

        // Upper bound of an open-ended query; stays inside the nanosecond system_clock range
        core::Timestamp openEnd()
        {
            return core::utils::makeTimestamp(2200, 1, 1);
        }

        // Returns a null handle when preparation fails; the caller reports sqlite3_errmsg
        StatementPtr prepare(sqlite3* db, const char* sql)
        {
            sqlite3_stmt* raw = nullptr;
            if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
            {
                sqlite3_finalize(raw);
                raw = nullptr;
            }
            return StatementPtr(raw, &sqlite3_finalize);
        }

        void bindText(sqlite3_stmt* stmt, int position, const std::string& value)
        {
            sqlite3_bind_text(stmt, position, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        }

        core::Timestamp columnTimestamp(sqlite3_stmt* stmt, int column)
        {
            const unsigned char* text = sqlite3_column_text(stmt, column);
            if (!text)
            {
                throw core::DataLoadException("NULL timestamp in historical_candles row.");
            }
            return core::utils::stringToTimestamp(reinterpret_cast<const char*>(text));
        }

        core::Candle readCandle(sqlite3_stmt* stmt)
        {
            core::Candle candle;
            candle.open_time = columnTimestamp(stmt, 0);
            candle.close_time = columnTimestamp(stmt, 1);
            candle.open = sqlite3_column_double(stmt, 2);
            candle.high = sqlite3_column_double(stmt, 3);
            candle.low = sqlite3_column_double(stmt, 4);
            candle.close = sqlite3_column_double(stmt, 5);
            candle.volume = sqlite3_column_double(stmt, 6);
            return candle;
        }

    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string& db_path)
        : database_path_(db_path)
    {
        core::logging::getLogger()->debug("DatabaseManager created for {}", database_path_);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        auto logger = core::logging::getLogger();
        if (isConnected())
        {
            logger->debug("Candle store {} is already open.", database_path_);
            return true;
        }

        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
        if (sqlite3_open_v2(database_path_.c_str(), &db_, flags, nullptr) != SQLITE_OK)
        {
            logger->error("Opening candle store '{}' failed: {}", database_path_,
                          db_ ? sqlite3_errmsg(db_) : "out of memory");
            sqlite3_close(db_); // SQLite allocates a handle even on failure
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        logger->info("Opened candle store {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!isConnected())
        {
            return;
        }

        if (sqlite3_close(db_) != SQLITE_OK)
        {
            core::logging::getLogger()->error("Closing candle store '{}' failed: {}", database_path_, sqlite3_errmsg(db_));
        }
        else
        {
            core::logging::getLogger()->debug("Closed candle store {}", database_path_);
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && db_ != nullptr;
    }

    bool DatabaseManager::executeSQL(const std::string& sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("SQL skipped, candle store is not open: {}", sql);
            return false;
        }

        char* error_msg = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg) != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL failed ({}): {}", sql, error_msg ? error_msg : sqlite3_errmsg(db_));
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!executeSQL(kCreateCandlesTable) || !executeSQL(kCreateCandlesIndex))
        {
            core::logging::getLogger()->error("Candle store schema check failed for {}", database_path_);
            return false;
        }
        core::logging::getLogger()->debug("Candle store schema ready.");
        return true;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string& symbol,
        core::Interval interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Candle query for " + symbol + " on a closed store.");
        }

        const std::string interval_str = core::utils::intervalToString(interval);
        StatementPtr stmt = prepare(db_, kSelectCandles);
        if (!stmt)
        {
            throw core::DataLoadException(std::string("Preparing candle query failed: ") + sqlite3_errmsg(db_));
        }

        bindText(stmt.get(), 1, symbol);
        bindText(stmt.get(), 2, interval_str);
        bindText(stmt.get(), 3, core::utils::timestampToString(start_time));
        bindText(stmt.get(), 4, core::utils::timestampToString(end_time));

        core::TimeSeries<core::Candle> candles;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            try
            {
                candles.push_back(readCandle(stmt.get()));
            } catch (const std::runtime_error& e) {
                throw core::DataLoadException("Malformed candle row for " + symbol + " (" + interval_str + "): " + e.what());
            }
        }
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(std::string("Reading candles failed: ") + sqlite3_errmsg(db_));
        }

        core::logging::getLogger()->debug("Read {} {} candles for {} from {}", candles.size(), interval_str, symbol,
                                          core::utils::timestampToString(start_time));
        return candles;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle>& candles,
                                      const std::string& symbol,
                                      core::Interval interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot store candles for {}: candle store is not open.", symbol);
            return false;
        }
        if (candles.empty())
        {
            return true;
        }

        const std::string interval_str = core::utils::intervalToString(interval);
        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            return false;
        }

        std::size_t inserted = 0;
        bool ok = true;
        {
            // Finalized before COMMIT/ROLLBACK
            StatementPtr stmt = prepare(db_, kInsertCandle);
            if (!stmt)
            {
                logger->error("Preparing candle insert failed: {}", sqlite3_errmsg(db_));
                ok = false;
            }

            for (std::size_t i = 0; ok && i < candles.size(); ++i)
            {
                const core::Candle& candle = candles[i];
                bindText(stmt.get(), 1, symbol);
                bindText(stmt.get(), 2, interval_str);
                bindText(stmt.get(), 3, core::utils::timestampToString(candle.open_time));
                bindText(stmt.get(), 4, core::utils::timestampToString(candle.close_time));
                sqlite3_bind_double(stmt.get(), 5, candle.open);
                sqlite3_bind_double(stmt.get(), 6, candle.high);
                sqlite3_bind_double(stmt.get(), 7, candle.low);
                sqlite3_bind_double(stmt.get(), 8, candle.close);
                sqlite3_bind_double(stmt.get(), 9, candle.volume);

                if (sqlite3_step(stmt.get()) != SQLITE_DONE)
                {
                    logger->error("Inserting {} candle {} failed: {}", symbol, i, sqlite3_errmsg(db_));
                    ok = false;
                    break;
                }
                inserted += static_cast<std::size_t>(sqlite3_changes(db_));
                if (sqlite3_reset(stmt.get()) != SQLITE_OK)
                {
                    logger->error("Resetting candle insert failed: {}", sqlite3_errmsg(db_));
                    ok = false;
                }
            }
        }

        if (!ok)
        {
            executeSQL("ROLLBACK;");
            logger->warn("Rolled back candle insert for {} ({}).", symbol, interval_str);
            return false;
        }
        if (!executeSQL("COMMIT;"))
        {
            executeSQL("ROLLBACK;");
            return false;
        }

        logger->info("Stored {} of {} {} candles for {} (existing rows kept).", inserted, candles.size(), interval_str, symbol);
        return true;
    }

    std::vector<core::SymbolData> DatabaseManager::loadSymbolData(const std::vector<std::string>& symbols,
                                                                  const std::vector<core::Interval>& intervals,
                                                                  core::Timestamp start_time,
                                                                  std::optional<core::Timestamp> end_time)
    {
        // Ascending and unique, whatever order the caller used
        const std::set<core::Interval> sorted_intervals(intervals.begin(), intervals.end());
        const core::Timestamp last_open = end_time.value_or(openEnd());

        std::vector<core::SymbolData> result;
        result.reserve(symbols.size());
        for (const auto& symbol : symbols)
        {
            core::SymbolData symbol_data;
            symbol_data.symbol = symbol;

            for (core::Interval interval : sorted_intervals)
            {
                core::Timeframe timeframe;
                timeframe.interval = interval;
                timeframe.candles = queryCandles(symbol, interval, start_time, last_open);
                if (timeframe.candles.empty())
                {
                    throw core::DataLoadException("No stored candles for " + symbol + " (" +
                                                  core::utils::intervalToString(interval) + ") from " +
                                                  core::utils::timestampToString(start_time));
                }
                symbol_data.timeframes.push_back(std::move(timeframe));
            }
            result.push_back(std::move(symbol_data));
        }

        core::logging::getLogger()->info("Loaded history for {} symbols x {} intervals from {}.",
                                         symbols.size(), sorted_intervals.size(), database_path_);
        return result;
    }

} // namespace data
