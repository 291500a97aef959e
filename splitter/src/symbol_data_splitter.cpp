#include "symbol_data_splitter.hpp"
#include "candle_search.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

namespace splitter {

    namespace {

        bool allSymbolsExhausted(const std::vector<std::vector<bool>>& exhausted) {
            return std::all_of(exhausted.begin(), exhausted.end(), [](const std::vector<bool>& timeframes) {
                return std::find(timeframes.begin(), timeframes.end(), true) != timeframes.end();
            });
        }

    } // end anonymous namespace

    SymbolDataSplitter::SymbolDataSplitter(SplitterOptions options)
        : options_(std::move(options))
    {
        core::logging::getLogger()->debug("SymbolDataSplitter created: days_per_split={}, warmup={}, start={}, correct_end_index={}",
                                          options_.days_per_split, options_.warmup_candles_count,
                                          core::utils::timestampToString(options_.backtesting_start),
                                          options_.correct_end_index);
    }

    std::vector<core::Part> SymbolDataSplitter::split(const std::vector<core::SymbolData>& symbols_data) {
        auto logger = core::logging::getLogger();

        validate(symbols_data);
        checkDuplicates(symbols_data);

        if (symbols_data.empty()) {
            logger->warn("No symbol data passed to the splitter; nothing to split.");
            return {};
        }

        if (options_.days_per_split <= 0) {
            logger->info("Splitting disabled; emitting {} symbols as a single part.", symbols_data.size());
            return splitWhole(symbols_data);
        }

        resolved_warmup_timeframe_ = resolveWarmupTimeframe(symbols_data);
        logger->info("Splitting {} symbols into {}-day parts (warmup {} candles, warmup timeframe {}).",
                     symbols_data.size(), options_.days_per_split, options_.warmup_candles_count,
                     core::utils::intervalToString(*resolved_warmup_timeframe_));

        auto parts = splitByDays(symbols_data);
        logger->info("Split produced {} parts.", parts.size());
        return parts;
    }

    void SymbolDataSplitter::validate(const std::vector<core::SymbolData>& symbols_data) {
        for (const auto& symbol : symbols_data) {
            if (symbol.timeframes.empty()) {
                throw core::InvalidInputException("Symbol '" + symbol.symbol + "' has no timeframes.");
            }

            for (std::size_t i = 0; i < symbol.timeframes.size(); ++i) {
                const core::Timeframe& timeframe = symbol.timeframes[i];
                if (timeframe.candles.empty()) {
                    throw core::InvalidInputException("Symbol '" + symbol.symbol + "' has an empty " +
                                                      core::utils::intervalToString(timeframe.interval) + " timeframe.");
                }
                if (i > 0 && timeframe.interval < symbol.timeframes[i - 1].interval) {
                    throw core::InvalidInputException("Timeframes of symbol '" + symbol.symbol +
                                                      "' are not sorted ascending by interval.");
                }

                // Rough check on the first and last pairs only; a full scan is the caller's job
                const auto& candles = timeframe.candles;
                const std::size_t n = candles.size();
                if (n >= 2 && (candles[1].open_time <= candles[0].open_time ||
                               candles[n - 1].open_time <= candles[n - 2].open_time)) {
                    throw core::InvalidInputException("Candles of symbol '" + symbol.symbol + "' (" +
                                                      core::utils::intervalToString(timeframe.interval) +
                                                      ") are not sorted ascending by open time.");
                }
            }
        }
    }

    void SymbolDataSplitter::checkDuplicates(const std::vector<core::SymbolData>& symbols_data) {
        std::set<std::string> symbols;
        for (const auto& symbol : symbols_data) {
            if (!symbols.insert(symbol.symbol).second) {
                throw core::DuplicateDataException("Duplicated symbol: " + symbol.symbol);
            }

            std::set<core::Interval> intervals;
            for (const auto& timeframe : symbol.timeframes) {
                if (!intervals.insert(timeframe.interval).second) {
                    throw core::DuplicateDataException("Duplicated " + core::utils::intervalToString(timeframe.interval) +
                                                       " timeframe for symbol " + symbol.symbol);
                }
            }
        }
    }

    core::Interval SymbolDataSplitter::resolveWarmupTimeframe(const std::vector<core::SymbolData>& symbols_data) const {
        if (options_.warmup_timeframe) {
            return *options_.warmup_timeframe;
        }

        // Start from the finest interval present anywhere
        core::Interval candidate = symbols_data.front().timeframes.front().interval;
        for (const auto& symbol : symbols_data) {
            candidate = std::min(candidate, symbol.timeframes.front().interval);
        }

        // Coarsest interval whose warmup window still opens before the backtesting start
        const std::size_t warmup = options_.warmup_candles_count;
        for (const auto& symbol : symbols_data) {
            for (const auto& timeframe : symbol.timeframes) {
                if (timeframe.interval <= candidate || timeframe.candles.size() <= warmup) {
                    continue;
                }
                if (timeframe.candles[warmup].open_time < options_.backtesting_start) {
                    candidate = timeframe.interval;
                }
            }
        }
        return candidate;
    }

    std::optional<std::size_t> SymbolDataSplitter::findCurrentIndex(const core::TimeSeries<core::Candle>& candles,
                                                                    core::Timestamp time) {
        auto first_open = core::candles::findFirstByOpenTime(candles, time);
        if (first_open && candles[*first_open].open_time == time) {
            return first_open;
        }

        // A coarser candle may have opened earlier and still be forming at `time`
        const std::size_t previous = first_open ? *first_open : candles.size();
        if (previous > 0 && candles[previous - 1].close_time >= time) {
            return previous - 1;
        }
        return first_open;
    }

    std::vector<core::Part> SymbolDataSplitter::splitWhole(const std::vector<core::SymbolData>& symbols_data) const {
        core::Part part = symbols_data;
        for (auto& symbol : part) {
            for (auto& timeframe : symbol.timeframes) {
                const std::size_t last = timeframe.candles.size() - 1;
                timeframe.index = findCurrentIndex(timeframe.candles, options_.backtesting_start).value_or(last);
                timeframe.start_index = core::candles::warmupStartIndex(timeframe.index, options_.warmup_candles_count);
                timeframe.end_index = last;
                timeframe.exhausted = true;
            }
        }

        std::vector<core::Part> parts;
        parts.push_back(std::move(part));
        return parts;
    }

    std::vector<core::Part> SymbolDataSplitter::splitByDays(const std::vector<core::SymbolData>& symbols_data) const {
        auto logger = core::logging::getLogger();

        // Exhaustion state per symbol and timeframe; the input itself stays untouched
        std::vector<std::vector<bool>> exhausted(symbols_data.size());
        for (std::size_t s = 0; s < symbols_data.size(); ++s) {
            exhausted[s].assign(symbols_data[s].timeframes.size(), false);
        }

        std::vector<core::Part> parts;
        core::Timestamp ongoing_time = options_.backtesting_start;

        while (!allSymbolsExhausted(exhausted)) {
            const core::Timestamp period_end = core::utils::addDays(ongoing_time, options_.days_per_split);
            const core::Timestamp period_last_close = period_end - std::chrono::seconds(1);

            core::Part part;
            for (std::size_t s = 0; s < symbols_data.size(); ++s) {
                const core::SymbolData& symbol = symbols_data[s];
                auto& symbol_exhausted = exhausted[s];
                if (std::find(symbol_exhausted.begin(), symbol_exhausted.end(), true) != symbol_exhausted.end()) {
                    continue;
                }

                core::SymbolData symbol_part;
                symbol_part.symbol = symbol.symbol;

                // Earliest end-candle close among siblings exhausted earlier in this pass
                std::optional<core::Timestamp> exhausted_sibling_close;
                // The finest timeframe drives the engine; a symbol without it sits the part out
                bool lowest_missing = false;

                for (std::size_t t = 0; t < symbol.timeframes.size(); ++t) {
                    const core::Timeframe& timeframe = symbol.timeframes[t];
                    const auto& candles = timeframe.candles;

                    auto index = findCurrentIndex(candles, ongoing_time);
                    if (!index) {
                        // History ended exactly on the previous boundary
                        symbol_exhausted[t] = true;
                        lowest_missing = lowest_missing || t == 0;
                        continue;
                    }

                    Cursor cursor;
                    cursor.index = *index;
                    cursor.start_index = core::candles::warmupStartIndex(cursor.index, options_.warmup_candles_count);

                    // A sibling that ran out of history bounds this timeframe too, even past its own end
                    auto end_index = (options_.correct_end_index && exhausted_sibling_close)
                        ? core::candles::findFirstByCloseTime(candles, *exhausted_sibling_close)
                        : core::candles::findFirstByCloseTime(candles, period_last_close);
                    if (end_index) {
                        cursor.end_index = *end_index;
                    } else {
                        cursor.end_index = candles.size() - 1;
                        cursor.exhausted = true;
                    }
                    symbol_exhausted[t] = cursor.exhausted;

                    if (cursor.exhausted) {
                        const core::Timestamp end_close = candles[cursor.end_index].close_time;
                        if (!exhausted_sibling_close || end_close < *exhausted_sibling_close) {
                            exhausted_sibling_close = end_close;
                        }
                    }

                    // History of this timeframe has not begun within the period
                    if (candles[cursor.index].open_time >= period_end) {
                        lowest_missing = lowest_missing || t == 0;
                        continue;
                    }

                    core::Timeframe timeframe_part;
                    timeframe_part.interval = timeframe.interval;
                    timeframe_part.candles = core::candles::copyRange(candles, cursor.start_index, cursor.end_index);
                    timeframe_part.index = cursor.index - cursor.start_index;
                    timeframe_part.end_index = cursor.end_index - cursor.start_index;
                    timeframe_part.start_index = 0;
                    timeframe_part.exhausted = cursor.exhausted;
                    symbol_part.timeframes.push_back(std::move(timeframe_part));
                }

                if (!lowest_missing && !symbol_part.timeframes.empty()) {
                    part.push_back(std::move(symbol_part));
                }
            }

            if (!part.empty()) {
                logger->debug("Part {} starts {} with {} symbols.", parts.size(),
                              core::utils::timestampToString(ongoing_time), part.size());
                parts.push_back(std::move(part));
            }

            ongoing_time = period_end;
        }

        return parts;
    }

} // namespace splitter
