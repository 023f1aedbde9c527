#include <gtest/gtest.h>

#include "patterns.hpp"
#include "test_helpers.hpp"

#include <chrono>

using namespace test_helpers;
using std::chrono::minutes;

// ===========================================================================
// Multi-timeframe alignment
// ===========================================================================

TEST(MultiTimeframeAlignmentTest, AgreeingTrends) {
    EXPECT_EQ(patterns::multi_timeframe_alignment(TrendDirection::Bullish, TrendDirection::Bullish), 1);
    EXPECT_EQ(patterns::multi_timeframe_alignment(TrendDirection::Bearish, TrendDirection::Bearish), -1);
}

TEST(MultiTimeframeAlignmentTest, DisagreeingOrUndeterminedTrends) {
    EXPECT_EQ(patterns::multi_timeframe_alignment(TrendDirection::Bullish, TrendDirection::Bearish), 0);
    EXPECT_EQ(patterns::multi_timeframe_alignment(TrendDirection::Bullish, TrendDirection::Neutral), 0);
    EXPECT_EQ(patterns::multi_timeframe_alignment(TrendDirection::Neutral, TrendDirection::Neutral), 0);
    EXPECT_EQ(patterns::multi_timeframe_alignment(TrendDirection::Undetermined,
                                                  TrendDirection::Undetermined), 0);
}

// ===========================================================================
// Stop-run detection
// ===========================================================================

class StopRunTest : public ::testing::Test {
protected:
    // 16 flat bars: highs 2000.5, lows 1999.5
    void SetUp() override {
        series = make_series(16, 2000.0, 0.0, minutes(5), as_of());
    }

    void set_last(double open, double high, double low, double close) {
        series.bars.back() = make_bar(series.last().timestamp, open, high, low, close);
    }

    TimeframeSeries series;
    std::optional<double> atr = 1.0;
};

TEST_F(StopRunTest, SweepBelowLowAndCloseInsideIsBullish) {
    set_last(2000.0, 2000.5, 1997.0, 2000.3);
    auto result = patterns::detect_stop_run(series, 15, atr, 0.1);
    EXPECT_TRUE(result.determined);
    EXPECT_EQ(result.kind, StopRun::Bullish);
    EXPECT_DOUBLE_EQ(result.prior_low, 1999.5);
    EXPECT_DOUBLE_EQ(result.margin, 0.1);
}

TEST_F(StopRunTest, SweepAboveHighAndCloseInsideIsBearish) {
    set_last(2000.0, 2003.0, 1999.5, 1999.7);
    auto result = patterns::detect_stop_run(series, 15, atr, 0.1);
    EXPECT_EQ(result.kind, StopRun::Bearish);
    EXPECT_DOUBLE_EQ(result.prior_high, 2000.5);
}

TEST_F(StopRunTest, BreakdownWithCloseBelowLowIsContinuation) {
    set_last(2000.0, 2000.5, 1997.0, 1998.0);
    EXPECT_EQ(patterns::detect_stop_run(series, 15, atr, 0.1).kind, StopRun::None);
}

TEST_F(StopRunTest, OutsideBarThroughBothExtremesIsIgnored) {
    set_last(2000.0, 2003.0, 1997.0, 2000.0);
    auto result = patterns::detect_stop_run(series, 15, atr, 0.1);
    EXPECT_TRUE(result.determined);
    EXPECT_EQ(result.kind, StopRun::None);
}

TEST_F(StopRunTest, ProbeWithinMarginIsNotASweep) {
    set_last(2000.0, 2000.5, 1999.45, 2000.2);
    EXPECT_EQ(patterns::detect_stop_run(series, 15, atr, 0.1).kind, StopRun::None);
}

TEST_F(StopRunTest, CurrentBarExcludedFromPriorExtremes) {
    set_last(2000.0, 2000.5, 1990.0, 2000.1);
    auto result = patterns::detect_stop_run(series, 15, atr, 0.1);
    EXPECT_DOUBLE_EQ(result.prior_low, 1999.5);
    EXPECT_EQ(result.kind, StopRun::Bullish);
}

TEST_F(StopRunTest, MissingAtrOrShortHistoryIsUndetermined) {
    set_last(2000.0, 2000.5, 1997.0, 2000.3);
    EXPECT_FALSE(patterns::detect_stop_run(series, 15, std::nullopt, 0.1).determined);
    EXPECT_FALSE(patterns::detect_stop_run(series, 16, atr, 0.1).determined);
}
