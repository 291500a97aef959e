#include <gtest/gtest.h>

#include "synthetic_history.hpp"
#include "utils.hpp"

#include <algorithm>

using core::Interval;

namespace {

    const core::Timestamp kStart = core::utils::makeTimestamp(2023, 1, 1);

} // end anonymous namespace

TEST(SyntheticHistoryTest, SameSeedGivesSameHistory) {
    data::SyntheticHistory first(11);
    data::SyntheticHistory second(11);
    auto a = first.generate({"BTCUSDT"}, {Interval::FiveMinutes}, kStart, 100);
    auto b = second.generate({"BTCUSDT"}, {Interval::FiveMinutes}, kStart, 100);

    ASSERT_EQ(a[0].timeframes[0].candles.size(), 100u);
    for (std::size_t i = 0; i < 100; ++i) {
        EXPECT_DOUBLE_EQ(a[0].timeframes[0].candles[i].close, b[0].timeframes[0].candles[i].close);
    }

    data::SyntheticHistory other(12);
    auto c = other.generate({"BTCUSDT"}, {Interval::FiveMinutes}, kStart, 100);
    EXPECT_NE(a[0].timeframes[0].candles.back().close, c[0].timeframes[0].candles.back().close);
}

TEST(SyntheticHistoryTest, CandlesAreContiguousAndWellFormed) {
    data::SyntheticHistory generator(3);
    auto history = generator.generate({"BTCUSDT"}, {Interval::FifteenMinutes}, kStart, 200);
    const auto& candles = history[0].timeframes[0].candles;

    for (std::size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        EXPECT_LT(c.open_time, c.close_time);
        EXPECT_GE(c.high, std::max(c.open, c.close));
        EXPECT_LE(c.low, std::min(c.open, c.close));
        if (i > 0) {
            EXPECT_EQ(c.open_time, candles[i - 1].close_time + std::chrono::seconds(1));
            EXPECT_DOUBLE_EQ(c.open, candles[i - 1].close);
        }
    }
}

TEST(SyntheticHistoryTest, CoarserIntervalsAggregateTheFinestOne) {
    data::SyntheticHistory generator(5);
    auto history = generator.generate({"BTCUSDT", "ETHUSDT"}, {Interval::OneHour, Interval::FiveMinutes}, kStart, 48);
    ASSERT_EQ(history.size(), 2u);

    const auto& fine = history[0].timeframes[0];
    const auto& hourly = history[0].timeframes[1];
    ASSERT_EQ(fine.interval, Interval::FiveMinutes);
    ASSERT_EQ(hourly.interval, Interval::OneHour);
    ASSERT_EQ(hourly.candles.size(), 4u);

    for (std::size_t h = 0; h < hourly.candles.size(); ++h) {
        auto first = fine.candles.begin() + static_cast<std::ptrdiff_t>(h * 12);
        auto last = first + 12;
        const auto& bar = hourly.candles[h];
        EXPECT_EQ(bar.open_time, first->open_time);
        EXPECT_EQ(bar.close_time, (last - 1)->close_time);
        EXPECT_DOUBLE_EQ(bar.open, first->open);
        EXPECT_DOUBLE_EQ(bar.close, (last - 1)->close);
        EXPECT_DOUBLE_EQ(bar.high, std::max_element(first, last, [](const core::Candle& a, const core::Candle& b) {
            return a.high < b.high; })->high);
        EXPECT_DOUBLE_EQ(bar.low, std::min_element(first, last, [](const core::Candle& a, const core::Candle& b) {
            return a.low < b.low; })->low);
    }
}

TEST(SyntheticHistoryTest, RejectsNonPositivePrice) {
    EXPECT_THROW(data::SyntheticHistory(1, 0.0), std::invalid_argument);
}
