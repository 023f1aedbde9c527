#include "report.hpp"
#include <algorithm>

ReportAssembler::ReportAssembler(const Config& config) : config_(config) {}

std::optional<RiskLevels> ReportAssembler::calculate_levels(
    const TimeframeSeries& fast,
    Bias bias,
    const std::optional<double>& atr
) const {
    if (bias == Bias::Neutral || !atr || *atr <= 0.0 || fast.empty()) {
        return std::nullopt;
    }

    const auto lookback = std::min(fast.size(), static_cast<std::size_t>(config_.swing_lookback));
    auto begin = fast.bars.end() - lookback;

    RiskLevels levels;
    levels.entry = fast.last().close;
    const double buffer = config_.atr_stop_multiple * *atr;

    if (bias == Bias::Buy) {
        double swing_low = std::min_element(begin, fast.bars.end(),
            [](const Bar& a, const Bar& b) { return a.low < b.low; })->low;
        levels.stop_loss = std::min(swing_low, levels.entry) - buffer;
        levels.take_profit = levels.entry + config_.risk_reward * (levels.entry - levels.stop_loss);
    } else {
        double swing_high = std::max_element(begin, fast.bars.end(),
            [](const Bar& a, const Bar& b) { return a.high < b.high; })->high;
        levels.stop_loss = std::max(swing_high, levels.entry) + buffer;
        levels.take_profit = levels.entry - config_.risk_reward * (levels.stop_loss - levels.entry);
    }

    return levels;
}

SignalReport ReportAssembler::assemble(
    const MarketSnapshot& snapshot,
    const FactorSet& factors,
    const ScoreResult& score,
    Signal signal,
    const LockState& lock,
    const SessionRisk& session,
    ForecastLabel forecast
) const {
    SignalReport report;
    report.instrument = snapshot.instrument;
    report.signal = lock.engaged ? Signal::Wait : signal;
    report.confidence = score.confidence;
    report.actionable = !lock.engaged && report.signal != Signal::Wait;
    report.bias = score.bias;
    report.lock = lock;
    report.session = session;
    report.forecast = forecast;
    report.trend_direction = factors.prevailing_trend();
    report.atr = factors.fast_atr;
    report.factors = factors;
    report.evaluated_at = snapshot.as_of;

    // A series rejected for ordering contributes no price either
    if (!snapshot.fast.empty() && snapshot.fast.is_strictly_increasing()) {
        report.entry_price = snapshot.fast.last().close;
    }

    if (auto levels = calculate_levels(snapshot.fast, score.bias, factors.fast_atr)) {
        report.stop_loss = levels->stop_loss;
        report.take_profit = levels->take_profit;
    }

    return report;
}
