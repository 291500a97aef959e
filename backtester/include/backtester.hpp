#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include "engine.hpp"
#include "strategy.hpp"
#include "symbol_data_splitter.hpp"

namespace backtester {

    enum class BacktestEventType {
        Started,
        SplitStarted,
        SplitFinished,
        EngineStarted,
        EngineFinished,
        Finished,
        Cancelled,
        Error
    };

    std::string eventTypeToString(BacktestEventType type);

    struct BacktestEvent {
        BacktestEventType type;
        std::string message;
        std::size_t parts_count = 0; // Known from SplitFinished on
        double progress = 0.0;
    };

    // Fire-and-forget; an observer that throws is logged and ignored
    using BacktestObserver = std::function<void(const BacktestEvent&)>;

    struct BacktestResult {
        engine::EngineState state = engine::EngineState::Idle;
        std::size_t parts_count = 0;
        std::size_t ticks = 0;
        std::optional<core::Interval> warmup_timeframe;
        double progress = 0.0;
    };

    class Backtester {
    public:
        // The strategy must outlive the backtester
        Backtester(const core::BacktestConfig& config, IStrategy& strategy);

        void setObserver(BacktestObserver observer);

        // Splits `history` and replays every part through the strategy. Splitter and
        // strategy exceptions are published as an Error event and rethrown; a
        // cancellation ends the run early with state Cancelled.
        BacktestResult run(const std::vector<core::SymbolData>& history,
                           const core::CancellationToken& cancellation = core::CancellationToken());

        // 0..100, safe to poll while run() executes on another thread
        double getProgress() const { return engine_.getProgress(); }

        std::size_t getTickCount() const { return ticks_.load(); }

    private:
        void publish(BacktestEventType type, const std::string& message, std::size_t parts_count = 0);

        IStrategy& strategy_;
        splitter::SymbolDataSplitter splitter_;
        engine::Engine engine_;
        BacktestObserver observer_;
        std::atomic<std::size_t> ticks_{0};
    };

} // namespace backtester
