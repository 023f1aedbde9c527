#include "indicators.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace indicators {

MovingAverageKind moving_average_kind_from_string(const std::string& kind) {
    if (kind == "sma") return MovingAverageKind::Simple;
    if (kind == "ema") return MovingAverageKind::Exponential;
    throw std::invalid_argument("unknown moving average kind: " + kind);
}

std::optional<double> simple_moving_average(const TimeframeSeries& series, int period) {
    if (period <= 0 || series.size() < static_cast<std::size_t>(period)) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (auto it = series.bars.end() - period; it != series.bars.end(); ++it) {
        sum += it->close;
    }
    return sum / period;
}

std::optional<double> exponential_moving_average(const TimeframeSeries& series, int period) {
    if (period <= 0 || series.size() < static_cast<std::size_t>(period)) {
        return std::nullopt;
    }

    const double alpha = 2.0 / (period + 1.0);
    double ema = series.bars.front().close;
    for (std::size_t i = 1; i < series.size(); ++i) {
        ema = alpha * series.bars[i].close + (1.0 - alpha) * ema;
    }
    return ema;
}

TrendDirection trend_direction(const TimeframeSeries& series, int period, MovingAverageKind kind) {
    auto ma = kind == MovingAverageKind::Simple
        ? simple_moving_average(series, period)
        : exponential_moving_average(series, period);

    if (!ma) {
        return TrendDirection::Undetermined;
    }

    switch (util::sign(series.last().close - *ma)) {
        case 1: return TrendDirection::Bullish;
        case -1: return TrendDirection::Bearish;
        default: return TrendDirection::Neutral;
    }
}

double true_range(const Bar& bar, const Bar& previous) {
    return std::max({
        bar.high - bar.low,
        std::abs(bar.high - previous.close),
        std::abs(bar.low - previous.close)
    });
}

std::optional<double> average_true_range(const TimeframeSeries& series, int window) {
    if (window <= 0 || series.size() < static_cast<std::size_t>(window) + 1) {
        return std::nullopt;
    }

    const auto& bars = series.bars;
    double sum = 0.0;
    for (std::size_t i = bars.size() - window; i < bars.size(); ++i) {
        sum += true_range(bars[i], bars[i - 1]);
    }
    return sum / window;
}

std::optional<double> relative_strength_index(const TimeframeSeries& series, int period) {
    if (period <= 0 || series.size() < static_cast<std::size_t>(period) + 1) {
        return std::nullopt;
    }

    const auto& bars = series.bars;
    double gains = 0.0;
    double losses = 0.0;
    for (std::size_t i = bars.size() - period; i < bars.size(); ++i) {
        double delta = bars[i].close - bars[i - 1].close;
        if (delta > 0.0) {
            gains += delta;
        } else {
            losses -= delta;
        }
    }

    if (gains == 0.0 && losses == 0.0) {
        return 50.0;
    }
    if (losses == 0.0) {
        return 100.0;
    }

    double rs = (gains / period) / (losses / period);
    return 100.0 - 100.0 / (1.0 + rs);
}

VsaLabel classify_vsa(const TimeframeSeries& series, TrendDirection trend, const VsaParams& params) {
    if (params.baseline_window <= 0 ||
        series.size() < static_cast<std::size_t>(params.baseline_window) + 1) {
        return VsaLabel::Undetermined;
    }

    const auto& bars = series.bars;
    const Bar& current = bars.back();
    if (!current.volume) {
        return VsaLabel::Undetermined;
    }

    double volume_sum = 0.0;
    double range_sum = 0.0;
    for (std::size_t i = bars.size() - 1 - params.baseline_window; i < bars.size() - 1; ++i) {
        if (!bars[i].volume) {
            return VsaLabel::Undetermined;
        }
        volume_sum += *bars[i].volume;
        range_sum += bars[i].high - bars[i].low;
    }

    const double avg_volume = volume_sum / params.baseline_window;
    const double avg_range = range_sum / params.baseline_window;
    if (avg_volume <= 0.0) {
        return VsaLabel::Undetermined;
    }

    const bool spike = *current.volume >= params.volume_spike_ratio * avg_volume;
    const int trend_sign = direction_sign(trend);
    if (!spike || trend_sign == 0) {
        return VsaLabel::Neutral;
    }

    // Heavy volume that fails to move price is absorption
    const double range = current.high - current.low;
    if (avg_range > 0.0 && range < params.narrow_range_ratio * avg_range) {
        return VsaLabel::Contradict;
    }

    const int bar_sign = util::sign(current.close - current.open);
    if (bar_sign == trend_sign) {
        return VsaLabel::Confirm;
    }
    if (bar_sign == -trend_sign) {
        return VsaLabel::Contradict;
    }
    return VsaLabel::Neutral;
}

bool is_expansion_bar(const TimeframeSeries& series, int window, double body_ratio) {
    if (window <= 0 || series.size() < static_cast<std::size_t>(window)) {
        return false;
    }

    double range_sum = 0.0;
    for (auto it = series.bars.end() - window; it != series.bars.end(); ++it) {
        range_sum += it->high - it->low;
    }

    const double mean_range = range_sum / window;
    const Bar& current = series.last();
    return mean_range > 0.0 && std::abs(current.close - current.open) > body_ratio * mean_range;
}

} // namespace indicators
