#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using TimePoint = std::chrono::system_clock::time_point;

// OHLC bar; volume is absent for feeds that do not report it
struct Bar {
    TimePoint timestamp;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    std::optional<double> volume;
};

struct TimeframeSeries {
    std::string interval;
    std::vector<Bar> bars;

    bool empty() const { return bars.empty(); }
    std::size_t size() const { return bars.size(); }
    const Bar& last() const { return bars.back(); }

    // Timestamps strictly increasing, no duplicate bars
    bool is_strictly_increasing() const;
};

struct MacroPoint {
    TimePoint timestamp;
    double value = 0.0;
};

using MacroSeries = std::vector<MacroPoint>;

// Nearest-preceding value at `at`, rejected when older than `tolerance`
std::optional<double> macro_value_at(
    const MacroSeries& series,
    const TimePoint& at,
    std::chrono::seconds tolerance
);

enum class Impact { Low, Medium, High };

struct NewsEvent {
    TimePoint timestamp;
    Impact impact = Impact::High;
    std::string title;
};

// One consistent view of everything the engine needs for a cycle
struct MarketSnapshot {
    std::string instrument;
    TimePoint as_of;
    TimeframeSeries fast;
    TimeframeSeries slow;
    MacroSeries yield;
    MacroSeries volatility;
    std::optional<std::vector<NewsEvent>> calendar;

    static MarketSnapshot from_json(const nlohmann::json& j);
};

enum class TrendDirection { Bullish, Bearish, Neutral, Undetermined };
enum class VsaLabel { Confirm, Neutral, Contradict, Undetermined };
enum class StopRun { None, Bullish, Bearish };
enum class Bias { Buy, Sell, Neutral };
enum class Signal { StrongBuy, Buy, Wait, Sell, StrongSell };
enum class LockReason { None, NewsWindow, VolatilityShock, DataUnavailable };

// Display strings are part of the output contract; add, never rename
enum class ForecastLabel {
    HighProbabilityContinuation,
    ProbableUpside,
    ProbableDownside,
    Consolidation,
    StayOut,
    InstitutionalRally,
    InstitutionalDump,
    MultiTimeframeConfluence,
    LiquidityReversal,
    YieldSupported
};

std::string to_string(TrendDirection direction);
std::string to_string(VsaLabel label);
std::string to_string(StopRun stop_run);
std::string to_string(Bias bias);
std::string to_string(Signal signal);
std::string to_string(LockReason reason);
std::string to_string(ForecastLabel label);
std::string to_string(Impact impact);
Impact impact_from_string(const std::string& value);

int direction_sign(TrendDirection direction);
int bias_sign(Bias bias);

struct YieldAnalysis {
    bool determined = false;
    int price_direction = 0;
    int yield_direction = 0;
    double price_change = 0.0;
    double yield_change = 0.0;
};

// Signed contributions: +1 bullish, -1 bearish, 0 none/undetermined.
// yield_support is relative to the bias (+1 supports, -1 contradicts).
struct FactorSet {
    int trend_alignment = 0;
    int vsa_confirmation = 0;
    int liquidity_reversal = 0;
    int momentum_confirmation = 0;
    int expansion = 0;
    int yield_support = 0;
    bool volatility_danger = false;

    // Inputs the factors were derived from
    TrendDirection fast_trend = TrendDirection::Undetermined;
    TrendDirection slow_trend = TrendDirection::Undetermined;
    std::optional<double> fast_atr;
    std::optional<double> rsi;
    VsaLabel vsa = VsaLabel::Undetermined;
    StopRun stop_run = StopRun::None;
    bool expansion_bar = false;
    YieldAnalysis yield;

    std::vector<std::string> reasons;

    // Slow timeframe when it has a direction, otherwise the fast one
    TrendDirection prevailing_trend() const;

    nlohmann::json to_json() const;
};

struct ScoreResult {
    double confidence = 50.0;
    Bias bias = Bias::Neutral;
    double net_weight = 0.0;
};

struct LockState {
    bool engaged = false;
    LockReason reason = LockReason::None;
    std::string detail;
    bool latched = false;

    nlohmann::json to_json() const;
};

struct SessionRisk {
    std::string name;
    bool soft_lock = false;
    double multiplier = 1.0;

    nlohmann::json to_json() const;
};

struct SignalReport {
    std::string instrument;
    Signal signal = Signal::Wait;
    double confidence = 0.0;
    bool actionable = false;
    Bias bias = Bias::Neutral;
    LockState lock;
    SessionRisk session;
    ForecastLabel forecast = ForecastLabel::Consolidation;
    TrendDirection trend_direction = TrendDirection::Undetermined;
    std::optional<double> entry_price;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    std::optional<double> atr;
    FactorSet factors;
    std::vector<std::string> reasons;
    TimePoint evaluated_at;

    nlohmann::json to_json() const;
    std::string to_string() const;
};
