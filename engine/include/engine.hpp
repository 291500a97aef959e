#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <vector>

#include "cancellation.hpp"
#include "datatypes.hpp"

namespace engine {

    struct EngineOptions {
        std::size_t warmup_candles_count = 0;
        bool sort_descending = true;              // Most recent candle first in every window
        bool use_full_candle_for_current = false; // Feed the current candle unmasked
    };

    enum class EngineState {
        Idle,
        Running,
        Cancelled,
        Finished,
        Failed    // The tick callback threw
    };

    // Per-tick feed: one entry per symbol still replaying, each timeframe holding at most
    // warmup_candles_count + 1 owned candles. Cursor fields are left at their defaults.
    using Window = std::vector<core::SymbolData>;

    // The window is exclusively owned by the callee for the duration of the call and may be
    // moved from or modified.
    using TickCallback = std::function<void(Window&)>;
    using CancellationFinishedCallback = std::function<void()>;

    // Replays split parts tick by tick. Each tick clones a warmup-bounded window per symbol,
    // masks the still-forming candle, hands the window to the tick callback and then
    // advances the cursors of the part, driven by the lowest timeframe.
    class Engine {
    public:
        Engine(EngineOptions options, TickCallback on_tick);

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        void setOnCancellationFinished(CancellationFinishedCallback callback);

        // Runs every part in order, mutating only the cursors of `parts`. A cancellation
        // request stops the run at the next tick boundary and fires the cancellation hook;
        // it is not reported as an error. Exceptions thrown by the tick callback propagate.
        void run(std::vector<core::Part>& parts,
                 const core::CancellationToken& cancellation = core::CancellationToken());

        // 0..100, safe to poll from another thread
        double getProgress() const;

        EngineState getState() const { return state_.load(); }
        const EngineOptions& getOptions() const { return options_; }

        // --- Tick stages ---

        // Positions of the symbols whose lowest timeframe has not reached its end index
        static std::vector<std::size_t> activeSymbols(const core::Part& part);

        Window cloneFeedingWindow(const core::Part& part, const std::vector<std::size_t>& active) const;

        // Expects ascending windows as produced by cloneFeedingWindow
        void maskCurrentCandles(const core::Part& part, const std::vector<std::size_t>& active, Window& window) const;

        void advanceCursors(core::Part& part, const std::vector<std::size_t>& active) const;

    private:
        core::SymbolData cloneSymbol(const core::SymbolData& source) const;
        static void maskSymbol(const core::SymbolData& source, core::SymbolData& feed);
        static void advanceSymbol(core::SymbolData& symbol);
        static void reverseCandles(Window& window);
        static std::size_t partMaxEndIndex(const core::Part& part);

        void runPart(core::Part& part, const core::CancellationToken& cancellation);
        void updateProgress(const core::Part& part);

        EngineOptions options_;
        TickCallback on_tick_;
        CancellationFinishedCallback on_cancellation_finished_;

        std::atomic<EngineState> state_{EngineState::Idle};
        std::atomic<std::size_t> progress_index_{0};
        std::atomic<std::size_t> max_index_{0};
        std::size_t completed_parts_index_ = 0; // Sum of max end indexes of finished parts
    };

} // namespace engine
