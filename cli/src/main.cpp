// cli/src/main.cpp

#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <chrono>
#include <csignal>
#include <atomic>
#include <thread>
#include <memory>

#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "config.hpp"
#include "cancellation.hpp"
#include "database_manager.hpp"
#include "synthetic_history.hpp"
#include "backtester.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    std::atomic<bool> g_interrupted{false};

    void handleSigint(int) {
        g_interrupted.store(true);
    }

    // Traces every window it receives
    class LoggingStrategy : public backtester::IStrategy {
    public:
        explicit LoggingStrategy(bool descending) : descending_(descending) {}

        std::string getName() const override { return "LoggingStrategy"; }

        void onTick(engine::Window& window) override {
            auto logger = core::logging::getLogger();
            if (!logger->should_log(spdlog::level::trace) || window.empty()) {
                return;
            }
            for (const auto& symbol : window) {
                const auto& lowest = symbol.timeframes.front().candles;
                const core::Candle& current = descending_ ? lowest.front() : lowest.back();
                logger->trace("Tick {} {}: open {:.4f} ({} candles in lowest timeframe)",
                              symbol.symbol, core::utils::timestampToString(current.open_time),
                              current.open, lowest.size());
            }
        }

    private:
        bool descending_;
    };

    // Earliest candle to load: enough of the coarsest interval before the start for warmup
    core::Timestamp historyStart(const core::BacktestConfig& config) {
        if (config.history_start) {
            return *config.history_start;
        }
        const auto coarsest = core::intervalDuration(config.intervals.back());
        return config.backtesting_start - coarsest * static_cast<std::int64_t>(config.warmup_candles_count + 1);
    }

    std::vector<core::SymbolData> loadHistory(const core::BacktestConfig& config) {
        auto logger = core::logging::getLogger();
        const core::Timestamp start = historyStart(config);

        if (config.data_source == core::DataSource::Synthetic) {
            logger->info("Using synthetic history from {} (seed {}).", core::utils::timestampToString(start), config.synthetic_seed);
            data::SyntheticHistory generator(config.synthetic_seed);
            return generator.generate(config.symbols, config.intervals, start, config.synthetic_candles_count);
        }

        logger->info("Using SQLite database path: {}", config.database_path);
        data::DatabaseManager db_manager(config.database_path);
        if (!db_manager.connect()) {
            throw core::DataLoadException("Cannot open SQLite database: " + config.database_path);
        }
        if (!db_manager.initializeSchema()) {
            throw core::DataLoadException("Schema check failed for SQLite database: " + config.database_path);
        }
        auto history = db_manager.loadSymbolData(config.symbols, config.intervals, start, config.history_end);
        db_manager.disconnect();
        return history;
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 2;
    }

    try {
        // --- Configuration ---
        const std::string config_path = argv[1];
        core::BacktestConfig config = core::loadBacktestConfig(config_path);

        // --- Initialize Logging ---
        core::logging::initialize("candle_replay_cli", core::logging::level_from_string(config.log_level), spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Candle replay CLI starting with config {}", config_path);
        logger->info("Backtest Parameters: Start={}, DaysPerSplit={}, Warmup={}, Symbols={}, Intervals={}",
                     core::utils::timestampToString(config.backtesting_start), config.days_per_split,
                     config.warmup_candles_count, config.symbols.size(), config.intervals.size());

        // --- History ---
        std::vector<core::SymbolData> history = loadHistory(config);

        // --- Run Backtest ---
        LoggingStrategy strategy(config.sort_descending);
        backtester::Backtester the_backtester(config, strategy);
        the_backtester.setObserver([&logger](const backtester::BacktestEvent& event) {
            logger->info("[{}] {}", backtester::eventTypeToString(event.type), event.message);
        });

        core::CancellationToken cancellation;
        std::signal(SIGINT, handleSigint);

        backtester::BacktestResult result;
        std::exception_ptr run_error;
        std::atomic<bool> done{false};
        std::thread worker([&]() {
            try {
                result = the_backtester.run(history, cancellation);
            } catch (...) {
                run_error = std::current_exception(); // Rethrown on the main thread
            }
            done = true;
        });

        while (!done.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            if (g_interrupted.load() && !cancellation.isCancellationRequested()) {
                logger->warn("Interrupt received, cancelling backtest...");
                cancellation.cancel();
            }
            logger->info("Progress: {:.2f}%", the_backtester.getProgress());
        }
        worker.join();

        if (run_error) {
            std::rethrow_exception(run_error);
        }

        logger->info("Backtest summary: {} parts, {} ticks, {:.2f}% replayed{}.",
                     result.parts_count, result.ticks, result.progress,
                     result.state == engine::EngineState::Cancelled ? " (cancelled)" : "");
        logger->info("Candle replay CLI finished.");
        return result.state == engine::EngineState::Cancelled ? 130 : 0;

    // --- Exception Handling ---
    } catch (const core::CandleReplayException& ex) {
        std::cerr << "Candle Replay Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Candle Replay Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }
}
