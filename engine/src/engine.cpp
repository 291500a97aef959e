#include "engine.hpp"
#include "candle_search.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace engine {

    Engine::Engine(EngineOptions options, TickCallback on_tick)
        : options_(options), on_tick_(std::move(on_tick))
    {
        if (!on_tick_) {
            throw std::invalid_argument("Engine requires a tick callback.");
        }
        core::logging::getLogger()->debug("Engine created: warmup={}, descending={}, full current candle={}",
                                          options_.warmup_candles_count, options_.sort_descending,
                                          options_.use_full_candle_for_current);
    }

    void Engine::setOnCancellationFinished(CancellationFinishedCallback callback) {
        on_cancellation_finished_ = std::move(callback);
    }

    void Engine::run(std::vector<core::Part>& parts, const core::CancellationToken& cancellation) {
        auto logger = core::logging::getLogger();

        std::size_t max_index = 0;
        for (const auto& part : parts) {
            max_index += partMaxEndIndex(part);
        }
        max_index_ = max_index;
        progress_index_ = 0;
        completed_parts_index_ = 0;
        state_ = EngineState::Running;

        logger->info("Engine run started: {} parts, max index {}.", parts.size(), max_index);

        try {
            for (std::size_t i = 0; i < parts.size(); ++i) {
                logger->debug("Replaying part {}/{} ({} symbols).", i + 1, parts.size(), parts[i].size());
                runPart(parts[i], cancellation);
            }
        } catch (const core::OperationCancelledException&) {
            state_ = EngineState::Cancelled;
            logger->warn("Engine run cancelled at {:.2f}%.", getProgress());
            if (on_cancellation_finished_) {
                on_cancellation_finished_();
            }
            return;
        } catch (const std::exception& e) {
            state_ = EngineState::Failed;
            logger->error("Engine run aborted by tick callback: {}", e.what());
            throw;
        }

        state_ = EngineState::Finished;
        logger->info("Engine run finished ({:.2f}%).", getProgress());
    }

    double Engine::getProgress() const {
        const std::size_t max_index = max_index_.load();
        if (max_index == 0) {
            return 0.0;
        }
        const double progress = static_cast<double>(progress_index_.load()) / static_cast<double>(max_index) * 100.0;
        return std::min(progress, 100.0);
    }

    void Engine::runPart(core::Part& part, const core::CancellationToken& cancellation) {
        std::vector<std::size_t> active = activeSymbols(part);
        updateProgress(part);

        while (!active.empty()) {
            cancellation.throwIfCancellationRequested();

            Window window = cloneFeedingWindow(part, active);
            if (!options_.use_full_candle_for_current) {
                maskCurrentCandles(part, active, window);
            }
            if (options_.sort_descending) {
                reverseCandles(window);
            }

            on_tick_(window);

            advanceCursors(part, active);
            updateProgress(part);
            active = activeSymbols(part);
        }

        completed_parts_index_ += partMaxEndIndex(part);
        progress_index_ = completed_parts_index_;
    }

    std::vector<std::size_t> Engine::activeSymbols(const core::Part& part) {
        std::vector<std::size_t> active;
        active.reserve(part.size());
        for (std::size_t i = 0; i < part.size(); ++i) {
            const core::Timeframe& lowest = part[i].timeframes[0];
            if (lowest.index < lowest.end_index) {
                active.push_back(i);
            }
        }
        return active;
    }

    Window Engine::cloneFeedingWindow(const core::Part& part, const std::vector<std::size_t>& active) const {
        const std::size_t count = active.size();
        Window window(count);

        #pragma omp parallel for if (count > 1)
        for (std::size_t i = 0; i < count; ++i) {
            window[i] = cloneSymbol(part[active[i]]);
        }
        return window;
    }

    core::SymbolData Engine::cloneSymbol(const core::SymbolData& source) const {
        core::SymbolData feed;
        feed.symbol = source.symbol;
        feed.timeframes.reserve(source.timeframes.size());

        for (const core::Timeframe& timeframe : source.timeframes) {
            const std::size_t first = std::max(timeframe.start_index,
                core::candles::warmupStartIndex(timeframe.index, options_.warmup_candles_count));

            core::Timeframe cloned;
            cloned.interval = timeframe.interval;
            cloned.candles = core::candles::copyRange(timeframe.candles, first, timeframe.index);
            feed.timeframes.push_back(std::move(cloned));
        }
        return feed;
    }

    void Engine::maskCurrentCandles(const core::Part& part, const std::vector<std::size_t>& active, Window& window) const {
        const std::size_t count = active.size();

        #pragma omp parallel for if (count > 1)
        for (std::size_t i = 0; i < count; ++i) {
            maskSymbol(part[active[i]], window[i]);
        }
    }

    void Engine::maskSymbol(const core::SymbolData& source, core::SymbolData& feed) {
        core::Candle& reference = feed.timeframes[0].candles.back();
        const double ref_open = reference.open;
        const core::Timestamp ref_open_time = reference.open_time;
        const core::Timestamp ref_close_time = reference.close_time; // Before masking

        // Only the open of the still-forming candle is known at this instant
        reference.high = ref_open;
        reference.low = ref_open;
        reference.close = ref_open;
        reference.close_time = ref_open_time;

        const core::Timeframe& source_lowest = source.timeframes[0];

        for (std::size_t t = 1; t < feed.timeframes.size(); ++t) {
            core::Candle& candle = feed.timeframes[t].candles.back();

            // Closed together with the current lowest candle in an earlier tick; already final
            if (candle.close_time == ref_close_time && candle.open_time != ref_open_time) {
                continue;
            }

            const bool inside_span = ref_open_time > candle.open_time && ref_close_time < candle.close_time;

            candle.close = ref_open;
            candle.close_time = ref_open_time;
            candle.high = ref_open;
            candle.low = ref_open;

            if (inside_span) {
                // Consolidate the bar from its finished lowest-timeframe constituents
                auto first = core::candles::findFirstByOpenTime(source_lowest.candles, candle.open_time);
                if (first && *first < source_lowest.index) {
                    const auto range = core::candles::rangeHighLow(source_lowest.candles, *first, source_lowest.index,
                                                                   core::candles::HighLow{ref_open, ref_open});
                    candle.high = range.high;
                    candle.low = range.low;
                }
            }
        }
    }

    void Engine::reverseCandles(Window& window) {
        const std::size_t count = window.size();

        #pragma omp parallel for if (count > 1)
        for (std::size_t i = 0; i < count; ++i) {
            for (core::Timeframe& timeframe : window[i].timeframes) {
                std::reverse(timeframe.candles.begin(), timeframe.candles.end());
            }
        }
    }

    void Engine::advanceCursors(core::Part& part, const std::vector<std::size_t>& active) const {
        const std::size_t count = active.size();

        #pragma omp parallel for if (count > 1)
        for (std::size_t i = 0; i < count; ++i) {
            advanceSymbol(part[active[i]]);
        }
    }

    void Engine::advanceSymbol(core::SymbolData& symbol) {
        auto& timeframes = symbol.timeframes;
        const std::size_t count = timeframes.size();

        // Base: the first timeframe that can still move; the ones before it are done
        std::size_t base = count;
        for (std::size_t t = 0; t < count; ++t) {
            core::Timeframe& timeframe = timeframes[t];
            if (timeframe.index + 1 < timeframe.end_index) {
                base = t;
                break;
            }
            timeframe.index = timeframe.end_index;
        }
        if (base == count) {
            return;
        }

        core::Timeframe& base_timeframe = timeframes[base];
        ++base_timeframe.index;
        const core::Timestamp reference_time = base_timeframe.candles[base_timeframe.index].open_time;

        // A coarser bar rolls forward only once it closed before the new base bar opened
        for (std::size_t t = base + 1; t < count; ++t) {
            core::Timeframe& timeframe = timeframes[t];
            if (timeframe.index < timeframe.end_index &&
                timeframe.candles[timeframe.index].close_time < reference_time) {
                ++timeframe.index;
            }
        }
    }

    void Engine::updateProgress(const core::Part& part) {
        std::size_t part_index = 0;
        for (const auto& symbol : part) {
            const core::Timeframe& lowest = symbol.timeframes[0];
            part_index = std::max(part_index, std::min(lowest.index, lowest.end_index));
        }
        progress_index_ = completed_parts_index_ + part_index;
    }

    std::size_t Engine::partMaxEndIndex(const core::Part& part) {
        std::size_t max_end = 0;
        for (const auto& symbol : part) {
            max_end = std::max(max_end, symbol.timeframes[0].end_index);
        }
        return max_end;
    }

} // namespace engine
