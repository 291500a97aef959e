#include "backtester.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <utility>

namespace backtester {

    namespace {

        splitter::SplitterOptions toSplitterOptions(const core::BacktestConfig& config) {
            splitter::SplitterOptions options;
            options.days_per_split = config.days_per_split;
            options.warmup_candles_count = config.warmup_candles_count;
            options.backtesting_start = config.backtesting_start;
            options.correct_end_index = config.correct_end_index;
            options.warmup_timeframe = config.warmup_timeframe;
            return options;
        }

        engine::EngineOptions toEngineOptions(const core::BacktestConfig& config) {
            engine::EngineOptions options;
            options.warmup_candles_count = config.warmup_candles_count;
            options.sort_descending = config.sort_descending;
            options.use_full_candle_for_current = config.use_full_candle_for_current;
            return options;
        }

    } // end anonymous namespace

    std::string eventTypeToString(BacktestEventType type) {
        switch (type) {
            case BacktestEventType::Started:        return "Started";
            case BacktestEventType::SplitStarted:   return "SplitStarted";
            case BacktestEventType::SplitFinished:  return "SplitFinished";
            case BacktestEventType::EngineStarted:  return "EngineStarted";
            case BacktestEventType::EngineFinished: return "EngineFinished";
            case BacktestEventType::Finished:       return "Finished";
            case BacktestEventType::Cancelled:      return "Cancelled";
            case BacktestEventType::Error:          return "Error";
        }
        return "Unknown";
    }

    Backtester::Backtester(const core::BacktestConfig& config, IStrategy& strategy)
        : strategy_(strategy),
          splitter_(toSplitterOptions(config)),
          engine_(toEngineOptions(config), [this](engine::Window& window) {
              ++ticks_;
              strategy_.onTick(window);
          })
    {
        core::logging::getLogger()->debug("Backtester initialized for strategy '{}'.", strategy_.getName());
    }

    void Backtester::setObserver(BacktestObserver observer) {
        observer_ = std::move(observer);
    }

    BacktestResult Backtester::run(const std::vector<core::SymbolData>& history,
                                   const core::CancellationToken& cancellation)
    {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Starting Backtest Run: strategy '{}', {} symbols", strategy_.getName(), history.size());
        logger->info("========================================================");

        ticks_ = 0;
        BacktestResult result;
        publish(BacktestEventType::Started, "Backtest started for strategy " + strategy_.getName());

        // 1. Split
        publish(BacktestEventType::SplitStarted, "Splitting history");
        std::vector<core::Part> parts;
        try {
            parts = splitter_.split(history);
        } catch (const core::CandleReplayException& e) {
            logger->error("Splitting failed: {}", e.what());
            publish(BacktestEventType::Error, e.what());
            throw;
        }
        result.parts_count = parts.size();
        result.warmup_timeframe = splitter_.getWarmupTimeframe();

        std::string split_message = std::to_string(parts.size()) + " parts";
        if (result.warmup_timeframe) {
            split_message += ", warmup timeframe " + core::utils::intervalToString(*result.warmup_timeframe);
        }
        publish(BacktestEventType::SplitFinished, split_message, parts.size());

        // 2. Replay
        publish(BacktestEventType::EngineStarted, "Replaying parts", parts.size());
        try {
            engine_.run(parts, cancellation);
        } catch (const std::exception& e) {
            logger->error("Replay failed: {}", e.what());
            publish(BacktestEventType::Error, e.what(), parts.size());
            throw;
        }

        result.state = engine_.getState();
        result.ticks = ticks_.load();
        result.progress = engine_.getProgress();
        publish(BacktestEventType::EngineFinished, std::to_string(result.ticks) + " ticks", parts.size());

        if (result.state == engine::EngineState::Cancelled) {
            logger->warn("Backtest cancelled after {} ticks.", result.ticks);
            publish(BacktestEventType::Cancelled, "Backtest cancelled", parts.size());
        } else {
            logger->info("Backtest Run Completed for Strategy '{}': {} parts, {} ticks.",
                         strategy_.getName(), result.parts_count, result.ticks);
            publish(BacktestEventType::Finished, "Backtest finished", parts.size());
        }
        return result;
    }

    void Backtester::publish(BacktestEventType type, const std::string& message, std::size_t parts_count) {
        auto logger = core::logging::getLogger();
        logger->debug("Event {}: {}", eventTypeToString(type), message);
        if (!observer_) {
            return;
        }

        BacktestEvent event{type, message, parts_count, engine_.getProgress()};
        try {
            observer_(event);
        } catch (const std::exception& e) {
            logger->warn("Backtest observer threw on {}: {}", eventTypeToString(type), e.what());
        }
    }

} // namespace backtester
