#include "types.hpp"
#include "news_calendar.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <iterator>
#include <stdexcept>

bool TimeframeSeries::is_strictly_increasing() const {
    for (std::size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp <= bars[i - 1].timestamp) {
            return false;
        }
    }
    return true;
}

std::optional<double> macro_value_at(
    const MacroSeries& series,
    const TimePoint& at,
    std::chrono::seconds tolerance
) {
    // First point strictly after `at`; the one before it is the nearest-preceding match
    auto it = std::upper_bound(
        series.begin(), series.end(), at,
        [](const TimePoint& t, const MacroPoint& point) { return t < point.timestamp; }
    );

    if (it == series.begin()) {
        return std::nullopt;
    }

    const auto& match = *std::prev(it);
    if (at - match.timestamp > tolerance) {
        return std::nullopt;
    }

    return match.value;
}

namespace {

TimeframeSeries parse_series(const nlohmann::json& j) {
    TimeframeSeries series;
    series.interval = j.value("interval", "");

    for (const auto& item : j.at("bars")) {
        Bar bar;
        bar.timestamp = util::from_epoch_ms(item.at("t").get<std::int64_t>());
        bar.open = item.at("o").get<double>();
        bar.high = item.at("h").get<double>();
        bar.low = item.at("l").get<double>();
        bar.close = item.at("c").get<double>();
        if (item.contains("v") && !item["v"].is_null()) {
            bar.volume = item["v"].get<double>();
        }
        series.bars.push_back(bar);
    }

    return series;
}

MacroSeries parse_macro(const nlohmann::json& j) {
    MacroSeries series;
    for (const auto& item : j) {
        MacroPoint point;
        point.timestamp = util::from_epoch_ms(item.at("t").get<std::int64_t>());
        point.value = item.at("v").get<double>();
        series.push_back(point);
    }
    return series;
}

nlohmann::json optional_number(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

MarketSnapshot MarketSnapshot::from_json(const nlohmann::json& j) {
    MarketSnapshot snapshot;
    snapshot.instrument = j.value("instrument", "XAUUSD");
    snapshot.as_of = util::from_epoch_ms(j.at("as_of").get<std::int64_t>());
    snapshot.fast = parse_series(j.at("fast"));
    snapshot.slow = parse_series(j.at("slow"));

    if (j.contains("yield")) {
        snapshot.yield = parse_macro(j.at("yield"));
    }
    if (j.contains("volatility")) {
        snapshot.volatility = parse_macro(j.at("volatility"));
    }

    if (j.contains("calendar") && j["calendar"].is_array()) {
        snapshot.calendar = NewsCalendar::parse(j["calendar"]);
    }

    return snapshot;
}

std::string to_string(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::Bullish: return "BULLISH";
        case TrendDirection::Bearish: return "BEARISH";
        case TrendDirection::Neutral: return "NEUTRAL";
        case TrendDirection::Undetermined: return "UNDETERMINED";
    }
    return "UNDETERMINED";
}

std::string to_string(VsaLabel label) {
    switch (label) {
        case VsaLabel::Confirm: return "confirm";
        case VsaLabel::Neutral: return "neutral";
        case VsaLabel::Contradict: return "contradict";
        case VsaLabel::Undetermined: return "undetermined";
    }
    return "undetermined";
}

std::string to_string(StopRun stop_run) {
    switch (stop_run) {
        case StopRun::None: return "none";
        case StopRun::Bullish: return "bullish";
        case StopRun::Bearish: return "bearish";
    }
    return "none";
}

std::string to_string(Bias bias) {
    switch (bias) {
        case Bias::Buy: return "BUY";
        case Bias::Sell: return "SELL";
        case Bias::Neutral: return "NEUTRAL";
    }
    return "NEUTRAL";
}

std::string to_string(Signal signal) {
    switch (signal) {
        case Signal::StrongBuy: return "STRONG_BUY";
        case Signal::Buy: return "BUY";
        case Signal::Wait: return "WAIT";
        case Signal::Sell: return "SELL";
        case Signal::StrongSell: return "STRONG_SELL";
    }
    return "WAIT";
}

std::string to_string(LockReason reason) {
    switch (reason) {
        case LockReason::None: return "none";
        case LockReason::NewsWindow: return "news-window";
        case LockReason::VolatilityShock: return "volatility-shock";
        case LockReason::DataUnavailable: return "data-unavailable";
    }
    return "none";
}

std::string to_string(ForecastLabel label) {
    switch (label) {
        case ForecastLabel::HighProbabilityContinuation: return "High Probability Continuation";
        case ForecastLabel::ProbableUpside:
        case ForecastLabel::ProbableDownside: return "Probable Upside/Downside";
        case ForecastLabel::Consolidation: return "Consolidation";
        case ForecastLabel::StayOut: return "Stay Out (Dangerous)";
        // Direction is carried by the report's bias
        case ForecastLabel::InstitutionalRally:
        case ForecastLabel::InstitutionalDump: return "Institutional Rally/Dump";
        case ForecastLabel::MultiTimeframeConfluence: return "Multi-Timeframe Confluence";
        case ForecastLabel::LiquidityReversal: return "Liquidity Reversal";
        case ForecastLabel::YieldSupported: return "Yield-Supported";
    }
    return "Consolidation";
}

std::string to_string(Impact impact) {
    switch (impact) {
        case Impact::Low: return "low";
        case Impact::Medium: return "medium";
        case Impact::High: return "high";
    }
    return "high";
}

Impact impact_from_string(const std::string& value) {
    auto upper = util::to_upper(util::trim(value));
    if (upper == "LOW") return Impact::Low;
    if (upper == "MEDIUM" || upper == "MED") return Impact::Medium;
    if (upper == "HIGH") return Impact::High;
    throw std::invalid_argument("unknown impact level: " + value);
}

int direction_sign(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::Bullish: return 1;
        case TrendDirection::Bearish: return -1;
        default: return 0;
    }
}

int bias_sign(Bias bias) {
    switch (bias) {
        case Bias::Buy: return 1;
        case Bias::Sell: return -1;
        case Bias::Neutral: return 0;
    }
    return 0;
}

TrendDirection FactorSet::prevailing_trend() const {
    if (direction_sign(slow_trend) != 0) {
        return slow_trend;
    }
    if (direction_sign(fast_trend) != 0) {
        return fast_trend;
    }
    if (slow_trend == TrendDirection::Neutral || fast_trend == TrendDirection::Neutral) {
        return TrendDirection::Neutral;
    }
    return TrendDirection::Undetermined;
}

nlohmann::json FactorSet::to_json() const {
    nlohmann::json j;
    j["trend_alignment"] = trend_alignment;
    j["vsa_confirmation"] = vsa_confirmation;
    j["liquidity_reversal"] = liquidity_reversal;
    j["momentum_confirmation"] = momentum_confirmation;
    j["expansion"] = expansion;
    j["yield_support"] = yield_support;
    j["volatility_danger"] = volatility_danger;
    j["fast_trend"] = ::to_string(fast_trend);
    j["slow_trend"] = ::to_string(slow_trend);
    j["rsi"] = optional_number(rsi);
    j["vsa"] = ::to_string(vsa);
    j["stop_run"] = ::to_string(stop_run);
    j["yield_determined"] = yield.determined;
    return j;
}

nlohmann::json LockState::to_json() const {
    return {
        {"engaged", engaged},
        {"state", engaged ? "ON" : "OFF"},
        {"reason", ::to_string(reason)},
        {"detail", detail},
        {"latched", latched}
    };
}

nlohmann::json SessionRisk::to_json() const {
    return {
        {"name", name},
        {"soft_lock", soft_lock},
        {"multiplier", multiplier}
    };
}

nlohmann::json SignalReport::to_json() const {
    nlohmann::json j;
    j["instrument"] = instrument;
    j["signal"] = ::to_string(signal);
    j["confidence"] = confidence;
    j["actionable"] = actionable;
    j["bias"] = ::to_string(bias);
    j["lock"] = lock.to_json();
    j["session"] = session.to_json();
    j["forecast"] = ::to_string(forecast);
    j["trend_direction"] = ::to_string(trend_direction);
    j["entry_price"] = optional_number(entry_price);
    j["stop_loss"] = optional_number(stop_loss);
    j["take_profit"] = optional_number(take_profit);
    j["atr"] = optional_number(atr);
    j["factors"] = factors.to_json();
    j["reasons"] = reasons;
    j["evaluated_at"] = util::format_timestamp(evaluated_at);
    return j;
}

std::string SignalReport::to_string() const {
    std::string result = fmt::format("{} {} ({:.1f}%){}, forecast: {}\n",
                                     instrument, ::to_string(signal), confidence,
                                     lock.engaged ? " LOCKED" : "", ::to_string(forecast));
    result += fmt::format("Trend: {}, Bias: {}, Session: {}{}\n",
                          ::to_string(trend_direction), ::to_string(bias), session.name,
                          session.soft_lock ? " (reduced size)" : "");
    if (lock.engaged) {
        result += fmt::format("Lock: {} {}\n", ::to_string(lock.reason), lock.detail);
    }
    if (entry_price && stop_loss && take_profit) {
        result += fmt::format("Entry {:.2f}  SL {:.2f}  TP {:.2f}\n", *entry_price, *stop_loss, *take_profit);
    }

    result += "Reasons:\n";
    for (const auto& reason : reasons) {
        result += fmt::format("  - {}\n", reason);
    }

    return result;
}
