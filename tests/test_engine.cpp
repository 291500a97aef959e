#include <gtest/gtest.h>

#include "engine.hpp"
#include "symbol_data_splitter.hpp"
#include "synthetic_history.hpp"
#include "cancellation.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using core::Interval;
using test_helpers::makeCandle;
using test_helpers::makeCandles;
using test_helpers::makeSymbol;

namespace {

    const core::Timestamp kDay0 = core::utils::makeTimestamp(2024, 1, 1);

    std::vector<core::Part> splitWhole(const std::vector<core::SymbolData>& history, core::Timestamp start,
                                       std::size_t warmup) {
        splitter::SplitterOptions options;
        options.days_per_split = 0;
        options.warmup_candles_count = warmup;
        options.backtesting_start = start;
        return splitter::SymbolDataSplitter(options).split(history);
    }

    std::vector<core::Part> splitDaily(const std::vector<core::SymbolData>& history, core::Timestamp start,
                                       std::size_t warmup) {
        splitter::SplitterOptions options;
        options.days_per_split = 1;
        options.warmup_candles_count = warmup;
        options.backtesting_start = start;
        options.correct_end_index = true;
        return splitter::SymbolDataSplitter(options).split(history);
    }

    // Three daily candles inside one weekly candle, current cursor on `index`
    core::Part weeklyConsolidationPart(std::size_t index) {
        core::Timeframe daily;
        daily.interval = Interval::OneDay;
        daily.candles = {
            makeCandle(kDay0, Interval::OneDay, 100, 100, 98, 99),
            makeCandle(core::utils::addDays(kDay0, 1), Interval::OneDay, 99, 101, 97, 97),
            makeCandle(core::utils::addDays(kDay0, 2), Interval::OneDay, 97, 97, 95, 95),
        };
        daily.index = index;
        daily.end_index = 2;

        core::Timeframe weekly;
        weekly.interval = Interval::OneWeek;
        weekly.candles = {makeCandle(kDay0, Interval::OneWeek, 100, 102, 94, 93)};

        core::SymbolData symbol;
        symbol.symbol = "BTCUSDT";
        symbol.timeframes = {daily, weekly};
        return {symbol};
    }

    engine::Engine makeEngine(std::size_t warmup, engine::TickCallback callback, bool descending = true,
                              bool full_candle = false) {
        engine::EngineOptions options;
        options.warmup_candles_count = warmup;
        options.sort_descending = descending;
        options.use_full_candle_for_current = full_candle;
        return engine::Engine(options, std::move(callback));
    }

} // end anonymous namespace

TEST(EngineTest, WindowGrowsUntilWarmupIsFilled) {
    auto parts = splitWhole({makeSymbol("BTCUSDT", {Interval::FiveMinutes}, kDay0, 20)},
                            kDay0 + std::chrono::minutes(5), 3);

    std::vector<std::size_t> sizes;
    engine::Engine replay(engine::EngineOptions{3, true, false}, [&sizes](engine::Window& window) {
        ASSERT_EQ(window.size(), 1u);
        sizes.push_back(window[0].timeframes[0].candles.size());
    });
    replay.run(parts);

    // Cursor runs from 1 to 18; the candle at the end index is never current
    ASSERT_EQ(sizes.size(), 18u);
    EXPECT_EQ(sizes[0], 2u);
    EXPECT_EQ(sizes[1], 3u);
    for (std::size_t i = 2; i < sizes.size(); ++i) {
        EXPECT_EQ(sizes[i], 4u) << "tick " << i;
    }
    EXPECT_EQ(replay.getState(), engine::EngineState::Finished);
}

TEST(EngineTest, DescendingWindowStartsWithCurrentCandle) {
    auto parts = splitWhole({makeSymbol("BTCUSDT", {Interval::FiveMinutes}, kDay0, 10)}, kDay0, 4);

    std::size_t tick = 0;
    engine::Engine replay(engine::EngineOptions{4, true, false}, [&tick](engine::Window& window) {
        const auto& candles = window[0].timeframes[0].candles;
        EXPECT_EQ(candles.front().open_time, kDay0 + std::chrono::minutes(5) * static_cast<int>(tick));
        EXPECT_TRUE(std::is_sorted(candles.rbegin(), candles.rend()));
        ++tick;
    });
    replay.run(parts);
    EXPECT_EQ(tick, 9u);
}

TEST(EngineTest, AscendingWindowEndsWithCurrentCandle) {
    auto parts = splitWhole({makeSymbol("BTCUSDT", {Interval::FiveMinutes}, kDay0, 10)}, kDay0, 4);

    std::size_t tick = 0;
    auto replay = makeEngine(4, [&tick](engine::Window& window) {
        const auto& candles = window[0].timeframes[0].candles;
        EXPECT_EQ(candles.back().open_time, kDay0 + std::chrono::minutes(5) * static_cast<int>(tick));
        EXPECT_TRUE(std::is_sorted(candles.begin(), candles.end()));
        ++tick;
    }, false);
    replay.run(parts);
    EXPECT_EQ(tick, 9u);
}

TEST(EngineTest, CurrentCandleIsMaskedToItsOpen) {
    auto parts = splitWhole({makeSymbol("BTCUSDT", {Interval::FiveMinutes, Interval::OneHour}, kDay0, 60)},
                            kDay0 + std::chrono::minutes(30), 5);

    std::size_t ticks = 0;
    engine::Engine replay(engine::EngineOptions{5, true, false}, [&ticks](engine::Window& window) {
        const core::Candle& current = window[0].timeframes[0].candles.front();
        EXPECT_EQ(current.high, current.open);
        EXPECT_EQ(current.low, current.open);
        EXPECT_EQ(current.close, current.open);
        EXPECT_EQ(current.close_time, current.open_time);

        // Older candles stay complete
        const auto& candles = window[0].timeframes[0].candles;
        for (std::size_t i = 1; i < candles.size(); ++i) {
            EXPECT_EQ(candles[i].close, candles[i].open + 0.5);
        }
        ++ticks;
    });
    replay.run(parts);
    EXPECT_GT(ticks, 0u);
}

TEST(EngineTest, FullCandleModeFeedsCurrentCandleUnmasked) {
    auto parts = splitWhole({makeSymbol("BTCUSDT", {Interval::FiveMinutes}, kDay0, 10)}, kDay0, 2);

    auto replay = makeEngine(2, [](engine::Window& window) {
        const core::Candle& current = window[0].timeframes[0].candles.front();
        EXPECT_EQ(current.close, current.open + 0.5);
        EXPECT_EQ(current.high, current.open + 1.0);
        EXPECT_GT(current.close_time, current.open_time);
    }, true, true);
    replay.run(parts);
}

TEST(EngineTest, HigherCandleIsConsolidatedFromFinishedLowerCandles) {
    auto replay = makeEngine(2, [](engine::Window&) {});
    const std::vector<std::size_t> active = {0};

    {
        auto part = weeklyConsolidationPart(0);
        auto window = replay.cloneFeedingWindow(part, active);
        replay.maskCurrentCandles(part, active, window);
        const core::Candle& weekly = window[0].timeframes[1].candles.back();
        EXPECT_DOUBLE_EQ(weekly.open, 100.0);
        EXPECT_DOUBLE_EQ(weekly.high, 100.0);
        EXPECT_DOUBLE_EQ(weekly.low, 100.0);
        EXPECT_DOUBLE_EQ(weekly.close, 100.0);
        EXPECT_EQ(weekly.close_time, kDay0);
    }
    {
        auto part = weeklyConsolidationPart(1);
        auto window = replay.cloneFeedingWindow(part, active);
        replay.maskCurrentCandles(part, active, window);
        ASSERT_EQ(window[0].timeframes[0].candles.size(), 2u);
        const core::Candle& weekly = window[0].timeframes[1].candles.back();
        EXPECT_DOUBLE_EQ(weekly.open, 100.0);
        EXPECT_DOUBLE_EQ(weekly.high, 100.0);
        EXPECT_DOUBLE_EQ(weekly.low, 98.0);
        EXPECT_DOUBLE_EQ(weekly.close, 99.0);
        EXPECT_EQ(weekly.close_time, core::utils::addDays(kDay0, 1));
    }
    {
        auto part = weeklyConsolidationPart(2);
        auto window = replay.cloneFeedingWindow(part, active);
        replay.maskCurrentCandles(part, active, window);
        ASSERT_EQ(window[0].timeframes[0].candles.size(), 3u);
        const core::Candle& weekly = window[0].timeframes[1].candles.back();
        EXPECT_DOUBLE_EQ(weekly.open, 100.0);
        EXPECT_DOUBLE_EQ(weekly.high, 101.0);
        EXPECT_DOUBLE_EQ(weekly.low, 97.0);
        EXPECT_DOUBLE_EQ(weekly.close, 97.0);

        const core::Candle& daily = window[0].timeframes[0].candles.back();
        EXPECT_DOUBLE_EQ(daily.high, 97.0);
        EXPECT_DOUBLE_EQ(daily.low, 97.0);
    }
}

TEST(EngineTest, ConsolidationLooksPastTheWarmupWindow) {
    // Warmup 0 keeps only the current daily candle in the window
    auto replay = makeEngine(0, [](engine::Window&) {});
    const std::vector<std::size_t> active = {0};

    auto part = weeklyConsolidationPart(2);
    auto window = replay.cloneFeedingWindow(part, active);
    replay.maskCurrentCandles(part, active, window);

    ASSERT_EQ(window[0].timeframes[0].candles.size(), 1u);
    const core::Candle& weekly = window[0].timeframes[1].candles.back();
    EXPECT_DOUBLE_EQ(weekly.high, 101.0);
    EXPECT_DOUBLE_EQ(weekly.low, 97.0);
}

TEST(EngineTest, HigherCandleClosingWithCurrentCandleIsLeftUntouched) {
    core::Timeframe hourly;
    hourly.interval = Interval::OneHour;
    hourly.candles = makeCandles(kDay0, Interval::OneHour, 2);
    hourly.index = 1;
    hourly.end_index = 1;

    core::Timeframe two_hourly;
    two_hourly.interval = Interval::TwoHours;
    two_hourly.candles = makeCandles(kDay0, Interval::TwoHours, 1, 500.0);

    core::SymbolData symbol;
    symbol.symbol = "BTCUSDT";
    symbol.timeframes = {hourly, two_hourly};
    core::Part part = {symbol};

    auto replay = makeEngine(1, [](engine::Window&) {});
    const std::vector<std::size_t> active = {0};
    auto window = replay.cloneFeedingWindow(part, active);
    replay.maskCurrentCandles(part, active, window);

    const core::Candle& bar = window[0].timeframes[1].candles.back();
    EXPECT_DOUBLE_EQ(bar.close, 500.5);
    EXPECT_DOUBLE_EQ(bar.high, 501.0);
    EXPECT_EQ(bar.close_time, two_hourly.candles[0].close_time);
}

TEST(EngineTest, AdvanceMovesHigherTimeframeOnlyAfterItCloses) {
    auto parts = splitWhole({makeSymbol("BTCUSDT", {Interval::FiveMinutes, Interval::FifteenMinutes}, kDay0, 30)},
                            kDay0, 0);
    auto replay = makeEngine(0, [](engine::Window&) {});
    core::Part& part = parts[0];
    const std::vector<std::size_t> active = {0};

    const std::vector<std::size_t> expected_higher = {0, 0, 1, 1, 1, 2};
    for (std::size_t step = 0; step < expected_higher.size(); ++step) {
        replay.advanceCursors(part, active);
        EXPECT_EQ(part[0].timeframes[0].index, step + 1);
        EXPECT_EQ(part[0].timeframes[1].index, expected_higher[step]) << "step " << step;
    }
}

TEST(EngineTest, TimeframesStayAlignedDuringReplay) {
    data::SyntheticHistory generator(7);
    auto history = generator.generate({"BTCUSDT", "ETHUSDT"},
                                      {Interval::FiveMinutes, Interval::OneHour, Interval::FourHours},
                                      kDay0, 2016);
    auto parts = splitDaily(history, core::utils::addDays(kDay0, 1), 10);
    ASSERT_FALSE(parts.empty());

    std::size_t ticks = 0;
    engine::Engine replay(engine::EngineOptions{10, true, false}, [&ticks](engine::Window& window) {
        for (const auto& symbol : window) {
            const core::Candle& current = symbol.timeframes[0].candles.front();
            for (std::size_t t = 1; t < symbol.timeframes.size(); ++t) {
                const core::Candle& higher = symbol.timeframes[t].candles.front();
                EXPECT_LE(higher.open_time, current.open_time);
                EXPECT_GE(higher.close_time, current.open_time);
            }
        }
        ++ticks;
    });
    replay.run(parts);
    EXPECT_GT(ticks, 0u);
    EXPECT_DOUBLE_EQ(replay.getProgress(), 100.0);
}

TEST(EngineTest, FirstWindowHoldsWarmupCandles) {
    data::SyntheticHistory generator(42);
    auto history = generator.generate({"BTCUSDT"}, {Interval::FiveMinutes, Interval::OneDay},
                                      core::utils::makeTimestamp(2023, 1, 1), 500);
    const core::Timestamp start = core::utils::makeTimestamp(2023, 1, 1, 0, 10);
    auto parts = splitWhole(history, start, 2);
    ASSERT_EQ(parts.size(), 1u);

    std::size_t ticks = 0;
    engine::Engine replay(engine::EngineOptions{2, true, false}, [&](engine::Window& window) {
        if (ticks++ == 0) {
            ASSERT_EQ(window.size(), 1u);
            ASSERT_EQ(window[0].timeframes[0].candles.size(), 3u);
            EXPECT_EQ(window[0].timeframes[0].candles.front().open_time, start);
            EXPECT_EQ(window[0].timeframes[1].candles.size(), 1u);
        }
    });
    replay.run(parts);
    EXPECT_EQ(ticks, 497u);
    EXPECT_EQ(replay.getState(), engine::EngineState::Finished);
    EXPECT_DOUBLE_EQ(replay.getProgress(), 100.0);
}

TEST(EngineTest, FinishedSymbolsLeaveTheWindow) {
    std::vector<core::SymbolData> history = {
        makeSymbol("BTCUSDT", {Interval::FiveMinutes}, kDay0, 10),
        makeSymbol("ETHUSDT", {Interval::FiveMinutes}, kDay0, 5),
    };
    auto parts = splitWhole(history, kDay0, 1);

    std::vector<std::size_t> window_sizes;
    auto replay = makeEngine(1, [&window_sizes](engine::Window& window) {
        window_sizes.push_back(window.size());
    });
    replay.run(parts);

    ASSERT_EQ(window_sizes.size(), 9u);
    for (std::size_t i = 0; i < window_sizes.size(); ++i) {
        EXPECT_EQ(window_sizes[i], i < 4 ? 2u : 1u) << "tick " << i;
    }
}

TEST(EngineTest, ProgressIsMonotonicAndEndsAtHundred) {
    const core::Timestamp start = core::utils::makeTimestamp(2023, 1, 1, 3, 6, 50);
    const std::vector<Interval> intervals = {Interval::FiveMinutes, Interval::FifteenMinutes, Interval::OneHour};
    std::vector<core::SymbolData> history = {
        makeSymbol("BTCUSDT", intervals, start - std::chrono::hours(2), 672),
        makeSymbol("ETHUSDT", intervals, start - std::chrono::hours(2), 672),
    };
    auto parts = splitDaily(history, start, 2);
    ASSERT_EQ(parts.size(), 3u);

    std::vector<double> progress;
    engine::Engine* engine_ptr = nullptr;
    auto replay = makeEngine(2, [&](engine::Window&) { progress.push_back(engine_ptr->getProgress()); });
    engine_ptr = &replay;

    EXPECT_DOUBLE_EQ(replay.getProgress(), 0.0);
    replay.run(parts);

    ASSERT_FALSE(progress.empty());
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
    EXPECT_GE(progress.front(), 0.0);
    EXPECT_LT(progress.back(), 100.0);
    EXPECT_DOUBLE_EQ(replay.getProgress(), 100.0);
    EXPECT_EQ(replay.getState(), engine::EngineState::Finished);
}

TEST(EngineTest, EmptyRunReportsZeroProgress) {
    std::vector<core::Part> parts;
    auto replay = makeEngine(2, [](engine::Window&) { FAIL() << "no ticks expected"; });
    replay.run(parts);
    EXPECT_DOUBLE_EQ(replay.getProgress(), 0.0);
    EXPECT_EQ(replay.getState(), engine::EngineState::Finished);
}

TEST(EngineTest, CancellationStopsAfterCurrentTick) {
    auto parts = splitWhole({makeSymbol("BTCUSDT", {Interval::FiveMinutes}, kDay0, 50)}, kDay0, 2);

    core::CancellationToken cancellation;
    std::size_t ticks = 0;
    std::size_t hook_calls = 0;
    auto replay = makeEngine(2, [&](engine::Window&) {
        ++ticks;
        cancellation.cancel();
    });
    replay.setOnCancellationFinished([&hook_calls]() { ++hook_calls; });

    EXPECT_NO_THROW(replay.run(parts, cancellation));
    EXPECT_EQ(ticks, 1u);
    EXPECT_EQ(hook_calls, 1u);
    EXPECT_EQ(replay.getState(), engine::EngineState::Cancelled);
    EXPECT_LT(replay.getProgress(), 100.0);
}

TEST(EngineTest, TickCallbackExceptionPropagates) {
    auto parts = splitWhole({makeSymbol("BTCUSDT", {Interval::FiveMinutes}, kDay0, 10)}, kDay0, 2);

    auto replay = makeEngine(2, [](engine::Window&) { throw std::runtime_error("strategy failure"); });
    EXPECT_THROW(replay.run(parts), std::runtime_error);
    EXPECT_EQ(replay.getState(), engine::EngineState::Failed);
}

TEST(EngineTest, RequiresTickCallback) {
    EXPECT_THROW(engine::Engine(engine::EngineOptions{}, engine::TickCallback()), std::invalid_argument);
}
