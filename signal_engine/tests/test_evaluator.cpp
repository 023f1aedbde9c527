#include <gtest/gtest.h>

#include "evaluator.hpp"
#include "config.hpp"
#include "test_helpers.hpp"

#include <chrono>

using namespace test_helpers;
using std::chrono::minutes;

class SignalEvaluatorTest : public ::testing::Test {
protected:
    Config config;
    SignalEvaluator evaluator{config};
};

// ===========================================================================
// End-to-end scenarios
// ===========================================================================

TEST_F(SignalEvaluatorTest, BullishConfluenceIsActionableBuy) {
    auto report = evaluator.evaluate(trending_snapshot(1));

    EXPECT_EQ(report.signal, Signal::Buy);
    EXPECT_TRUE(report.actionable);
    EXPECT_DOUBLE_EQ(report.confidence, 78.0);
    EXPECT_GE(report.confidence, config.actionable_threshold);
    EXPECT_FALSE(report.lock.engaged);
    EXPECT_EQ(report.trend_direction, TrendDirection::Bullish);
    EXPECT_EQ(report.session.name, "LONDON");

    EXPECT_EQ(report.factors.trend_alignment, 1);
    EXPECT_EQ(report.factors.vsa_confirmation, 1);
    EXPECT_EQ(report.factors.momentum_confirmation, 1);
    EXPECT_EQ(report.factors.yield_support, 1);
    EXPECT_EQ(report.factors.liquidity_reversal, 0);
    EXPECT_FALSE(report.factors.volatility_danger);

    EXPECT_TRUE(report.forecast == ForecastLabel::InstitutionalRally ||
                report.forecast == ForecastLabel::MultiTimeframeConfluence);
    EXPECT_FALSE(report.reasons.empty());
}

TEST_F(SignalEvaluatorTest, BullishLevelsUseSwingLowAndAtr) {
    auto report = evaluator.evaluate(trending_snapshot(1));

    ASSERT_TRUE(report.entry_price && report.stop_loss && report.take_profit && report.atr);
    EXPECT_DOUBLE_EQ(*report.atr, 1.5);
    EXPECT_DOUBLE_EQ(*report.entry_price, 2124.5);
    EXPECT_DOUBLE_EQ(*report.stop_loss, 2116.75);
    EXPECT_DOUBLE_EQ(*report.take_profit, 2140.0);
}

TEST_F(SignalEvaluatorTest, BearishConfluenceIsSell) {
    auto report = evaluator.evaluate(trending_snapshot(-1));

    EXPECT_EQ(report.signal, Signal::Sell);
    EXPECT_EQ(report.bias, Bias::Sell);
    EXPECT_DOUBLE_EQ(report.confidence, 78.0);
    EXPECT_EQ(report.forecast, ForecastLabel::InstitutionalDump);
    EXPECT_EQ(report.trend_direction, TrendDirection::Bearish);
    ASSERT_TRUE(report.stop_loss && report.take_profit);
    EXPECT_GT(*report.stop_loss, *report.entry_price);
    EXPECT_LT(*report.take_profit, *report.entry_price);
}

TEST_F(SignalEvaluatorTest, FlatMarketIsConsolidation) {
    auto report = evaluator.evaluate(flat_snapshot());

    EXPECT_EQ(report.signal, Signal::Wait);
    EXPECT_FALSE(report.actionable);
    EXPECT_EQ(report.bias, Bias::Neutral);
    EXPECT_DOUBLE_EQ(report.confidence, 50.0);
    EXPECT_EQ(report.forecast, ForecastLabel::Consolidation);
    EXPECT_FALSE(report.lock.engaged);
    EXPECT_FALSE(report.stop_loss.has_value());
    EXPECT_EQ(report.reasons.front(), "no directional bias");
}

TEST_F(SignalEvaluatorTest, LiquiditySweepOnShortHistoryIsDeadZoneReversal) {
    // 40 bars: trends undetermined, a sweep of the 15-bar low closes back inside
    MarketSnapshot snapshot = flat_snapshot(40);
    Bar& last = snapshot.fast.bars.back();
    last = make_bar(last.timestamp, 2000.0, 2000.5, 1997.0, 2000.3);

    auto report = evaluator.evaluate(snapshot);

    EXPECT_EQ(report.factors.fast_trend, TrendDirection::Undetermined);
    EXPECT_EQ(report.factors.slow_trend, TrendDirection::Undetermined);
    EXPECT_EQ(report.factors.stop_run, StopRun::Bullish);
    EXPECT_EQ(report.factors.liquidity_reversal, 1);
    EXPECT_EQ(report.bias, Bias::Buy);
    EXPECT_DOUBLE_EQ(report.confidence, 57.0);
    EXPECT_EQ(report.signal, Signal::Wait);
    EXPECT_EQ(report.forecast, ForecastLabel::LiquidityReversal);
    EXPECT_NE(report.reasons.front().find("dead zone"), std::string::npos);
    ASSERT_TRUE(report.stop_loss.has_value());
    EXPECT_LT(*report.stop_loss, 1997.0);
}

// ===========================================================================
// Gates
// ===========================================================================

TEST_F(SignalEvaluatorTest, NewsWindowForcesWaitAndStayOut) {
    MarketSnapshot snapshot = trending_snapshot(1);
    snapshot.calendar = std::vector<NewsEvent>{make_event(as_of() + minutes(3), Impact::High, "NFP")};

    auto report = evaluator.evaluate(snapshot);

    EXPECT_TRUE(report.lock.engaged);
    EXPECT_EQ(report.lock.reason, LockReason::NewsWindow);
    EXPECT_EQ(report.signal, Signal::Wait);
    EXPECT_FALSE(report.actionable);
    EXPECT_EQ(report.forecast, ForecastLabel::StayOut);
    EXPECT_DOUBLE_EQ(report.confidence, 78.0);
    EXPECT_EQ(report.reasons.front().rfind("LOCKED", 0), 0u);
    EXPECT_EQ(report.to_json()["lock"]["state"], "ON");
}

TEST_F(SignalEvaluatorTest, VolatilityShockLocksAndPenalizes) {
    MarketSnapshot snapshot = trending_snapshot(1);
    snapshot.volatility.back().value = 104.3;

    auto report = evaluator.evaluate(snapshot);

    EXPECT_TRUE(report.factors.volatility_danger);
    EXPECT_EQ(report.lock.reason, LockReason::VolatilityShock);
    EXPECT_EQ(report.signal, Signal::Wait);
    EXPECT_DOUBLE_EQ(report.confidence, 68.0);
    EXPECT_EQ(report.forecast, ForecastLabel::StayOut);
}

TEST_F(SignalEvaluatorTest, AsianSessionHalvesEdgeWithoutLocking) {
    auto report = evaluator.evaluate(trending_snapshot(1, util::from_epoch_ms(kAsianAsOfMs)));

    EXPECT_EQ(report.session.name, "ASIAN");
    EXPECT_TRUE(report.session.soft_lock);
    EXPECT_FALSE(report.lock.engaged);
    EXPECT_EQ(report.lock.reason, LockReason::None);
    EXPECT_EQ(report.to_json()["lock"]["reason"], "none");
    EXPECT_TRUE(report.to_json()["session"]["soft_lock"].get<bool>());
    EXPECT_DOUBLE_EQ(report.confidence, 64.0);
    EXPECT_EQ(report.signal, Signal::Buy);
    EXPECT_EQ(report.forecast, ForecastLabel::MultiTimeframeConfluence);

    bool session_reason = false;
    for (const auto& reason : report.reasons) {
        session_reason = session_reason || reason.find("ASIAN session") != std::string::npos;
    }
    EXPECT_TRUE(session_reason);
}

TEST_F(SignalEvaluatorTest, LatchedLockAppliesWhenNothingTriggers) {
    LockState latched;
    latched.engaged = true;
    latched.latched = true;
    latched.reason = LockReason::NewsWindow;
    latched.detail = "cooldown 20 min remaining";

    auto report = evaluator.evaluate(trending_snapshot(1), latched);

    EXPECT_TRUE(report.lock.engaged);
    EXPECT_TRUE(report.lock.latched);
    EXPECT_EQ(report.signal, Signal::Wait);
}

// ===========================================================================
// Degraded input
// ===========================================================================

TEST_F(SignalEvaluatorTest, MissingFastSeriesIsDataUnavailable) {
    MarketSnapshot snapshot = trending_snapshot(1);
    snapshot.fast.bars.clear();

    auto report = evaluator.evaluate(snapshot);

    EXPECT_EQ(report.signal, Signal::Wait);
    EXPECT_DOUBLE_EQ(report.confidence, 0.0);
    EXPECT_TRUE(report.lock.engaged);
    EXPECT_EQ(report.lock.reason, LockReason::DataUnavailable);
    EXPECT_EQ(report.forecast, ForecastLabel::StayOut);
    EXPECT_EQ(report.to_json()["stop_loss"], nullptr);
}

TEST_F(SignalEvaluatorTest, OutOfOrderBarsNeverTrade) {
    MarketSnapshot snapshot = trending_snapshot(1);
    auto& bars = snapshot.fast.bars;
    bars[bars.size() - 2].timestamp = bars.back().timestamp;

    auto report = evaluator.evaluate(snapshot);

    EXPECT_EQ(report.signal, Signal::Wait);
    EXPECT_FALSE(report.actionable);
    EXPECT_FALSE(report.atr.has_value());
}

TEST_F(SignalEvaluatorTest, IdenticalSnapshotsProduceIdenticalReports) {
    MarketSnapshot snapshot = trending_snapshot(1);
    snapshot.calendar = std::vector<NewsEvent>{make_event(as_of() + minutes(90))};

    auto first = evaluator.evaluate(snapshot).to_json().dump();
    auto second = evaluator.evaluate(snapshot).to_json().dump();
    EXPECT_EQ(first, second);
}

TEST(MarketSnapshotTest, ParsesJsonContract) {
    auto j = nlohmann::json::parse(R"({
        "instrument": "XAUUSD",
        "as_of": 1709632800000,
        "fast": {"interval": "5m", "bars": [
            {"t": 1709632500000, "o": 2000.0, "h": 2001.0, "l": 1999.0, "c": 2000.5, "v": 1200},
            {"t": 1709632800000, "o": 2000.5, "h": 2002.0, "l": 2000.0, "c": 2001.5}
        ]},
        "slow": {"interval": "1h", "bars": []},
        "yield": [{"t": 1709632800000, "v": 4.21}],
        "volatility": [],
        "calendar": [{"t": 1709634600000, "impact": "high", "title": "FOMC"}]
    })");

    auto snapshot = MarketSnapshot::from_json(j);

    EXPECT_EQ(snapshot.instrument, "XAUUSD");
    EXPECT_EQ(snapshot.as_of, as_of());
    ASSERT_EQ(snapshot.fast.size(), 2u);
    EXPECT_TRUE(snapshot.fast.bars[0].volume.has_value());
    EXPECT_FALSE(snapshot.fast.bars[1].volume.has_value());
    EXPECT_TRUE(snapshot.slow.empty());
    ASSERT_EQ(snapshot.yield.size(), 1u);
    EXPECT_DOUBLE_EQ(snapshot.yield[0].value, 4.21);
    ASSERT_TRUE(snapshot.calendar.has_value());
    EXPECT_EQ(snapshot.calendar->front().title, "FOMC");
}

TEST(MarketSnapshotTest, AbsentCalendarStaysAbsent) {
    auto j = nlohmann::json::parse(R"({
        "as_of": 1709632800000,
        "fast": {"bars": []},
        "slow": {"bars": []}
    })");

    auto snapshot = MarketSnapshot::from_json(j);
    EXPECT_FALSE(snapshot.calendar.has_value());
    EXPECT_TRUE(snapshot.yield.empty());
}
