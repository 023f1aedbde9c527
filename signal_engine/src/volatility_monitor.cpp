#include "volatility_monitor.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <cmath>

VolatilityMonitor::VolatilityMonitor(const Config& config) : config_(config) {}

VolatilityShock VolatilityMonitor::assess(const MacroSeries& proxy, const TimePoint& as_of) const {
    VolatilityShock result;

    auto end = std::upper_bound(
        proxy.begin(), proxy.end(), as_of,
        [](const TimePoint& t, const MacroPoint& point) { return t < point.timestamp; }
    );
    const auto available = std::distance(proxy.begin(), end);
    if (available < 2) {
        return result;
    }

    const MacroPoint& latest = *(end - 1);
    if (as_of - latest.timestamp > config_.macro_alignment_tolerance()) {
        spdlog::debug("Volatility proxy is stale, shock check skipped");
        return result;
    }

    result.determined = true;
    result.latest = latest.value;
    result.previous = (end - 2)->value;

    const double step = std::abs(result.latest - result.previous);
    if (step > config_.vol_shock_abs_delta) {
        result.shock = true;
        result.detail = fmt::format("proxy moved {:.3f} in one step (limit {:.3f})",
                                    step, config_.vol_shock_abs_delta);
        return result;
    }

    if (available < config_.vol_baseline_window + 1) {
        return result;
    }

    double sum = 0.0;
    for (auto it = end - 1 - config_.vol_baseline_window; it != end - 1; ++it) {
        sum += it->value;
    }
    result.baseline_mean = sum / config_.vol_baseline_window;

    double sq_sum = 0.0;
    for (auto it = end - 1 - config_.vol_baseline_window; it != end - 1; ++it) {
        sq_sum += (it->value - result.baseline_mean) * (it->value - result.baseline_mean);
    }
    result.baseline_stddev = std::sqrt(sq_sum / config_.vol_baseline_window);

    const double deviation = std::abs(result.latest - result.baseline_mean);
    if (result.baseline_stddev > 0.0 && deviation > config_.vol_shock_sigma * result.baseline_stddev) {
        result.shock = true;
        result.detail = fmt::format("proxy {:.1f} sigma from its {}-point baseline",
                                    deviation / result.baseline_stddev, config_.vol_baseline_window);
    }

    return result;
}
