#include <gtest/gtest.h>

#include "report.hpp"
#include "config.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <utility>

using namespace test_helpers;
using std::chrono::minutes;

class ReportAssemblerTest : public ::testing::Test {
protected:
    Config config;
    ReportAssembler assembler{config};
    // Last 10 bars: lows 1999.5, highs 2000.5, last close 2000.0
    TimeframeSeries fast = make_series(30, 2000.0, 0.0, minutes(5), as_of());
};

TEST_F(ReportAssemblerTest, BuyStopBelowSwingLowAndTargetAtRiskReward) {
    auto levels = assembler.calculate_levels(fast, Bias::Buy, 2.0);
    ASSERT_TRUE(levels.has_value());

    EXPECT_DOUBLE_EQ(levels->entry, 2000.0);
    EXPECT_DOUBLE_EQ(levels->stop_loss, 1996.5);
    EXPECT_DOUBLE_EQ(levels->take_profit, 2007.0);
}

TEST_F(ReportAssemblerTest, SellStopAboveSwingHigh) {
    auto levels = assembler.calculate_levels(fast, Bias::Sell, 2.0);
    ASSERT_TRUE(levels.has_value());

    EXPECT_DOUBLE_EQ(levels->stop_loss, 2003.5);
    EXPECT_DOUBLE_EQ(levels->take_profit, 1993.0);
    EXPECT_GT(levels->stop_loss, levels->entry);
    EXPECT_LT(levels->take_profit, levels->entry);
}

TEST_F(ReportAssemblerTest, NoLevelsWithoutBiasOrAtr) {
    EXPECT_FALSE(assembler.calculate_levels(fast, Bias::Neutral, 2.0).has_value());
    EXPECT_FALSE(assembler.calculate_levels(fast, Bias::Buy, std::nullopt).has_value());
    EXPECT_FALSE(assembler.calculate_levels(fast, Bias::Buy, 0.0).has_value());
    EXPECT_FALSE(assembler.calculate_levels(TimeframeSeries{}, Bias::Buy, 2.0).has_value());
}

TEST_F(ReportAssemblerTest, LockForcesWaitButKeepsConfidence) {
    MarketSnapshot snapshot = flat_snapshot();
    FactorSet factors;
    factors.fast_atr = 1.0;

    ScoreResult score;
    score.confidence = 72.0;
    score.bias = Bias::Buy;

    LockState lock;
    lock.engaged = true;
    lock.reason = LockReason::VolatilityShock;

    SessionRisk session;
    session.name = "LONDON";

    auto report = assembler.assemble(snapshot, factors, score, Signal::Buy, lock, session,
                                     ForecastLabel::StayOut);

    EXPECT_EQ(report.signal, Signal::Wait);
    EXPECT_FALSE(report.actionable);
    EXPECT_DOUBLE_EQ(report.confidence, 72.0);
    EXPECT_EQ(report.evaluated_at, snapshot.as_of);
    ASSERT_TRUE(report.entry_price.has_value());
    EXPECT_DOUBLE_EQ(*report.entry_price, 2000.0);

    auto j = report.to_json();
    EXPECT_EQ(j["signal"], "WAIT");
    EXPECT_EQ(j["lock"]["reason"], "volatility-shock");
    EXPECT_EQ(j["forecast"], "Stay Out (Dangerous)");
    EXPECT_EQ(j["evaluated_at"], "2024-03-05T10:00:00.000Z");
}

TEST_F(ReportAssemblerTest, OutOfOrderFastSeriesHasNoEntryPrice) {
    MarketSnapshot snapshot = flat_snapshot();
    std::swap(snapshot.fast.bars[snapshot.fast.size() - 1].timestamp,
              snapshot.fast.bars[snapshot.fast.size() - 2].timestamp);
    ASSERT_FALSE(snapshot.fast.is_strictly_increasing());

    FactorSet factors;
    ScoreResult score;
    SessionRisk session;

    auto report = assembler.assemble(snapshot, factors, score, Signal::Wait, LockState(), session,
                                     ForecastLabel::Consolidation);

    EXPECT_FALSE(report.entry_price.has_value());
    EXPECT_TRUE(report.to_json()["entry_price"].is_null());
}
