#include "patterns.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace patterns {

int multi_timeframe_alignment(TrendDirection fast, TrendDirection slow) {
    const int fast_sign = direction_sign(fast);
    if (fast_sign != 0 && fast_sign == direction_sign(slow)) {
        return fast_sign;
    }
    return 0;
}

StopRunResult detect_stop_run(
    const TimeframeSeries& series,
    int lookback,
    const std::optional<double>& atr,
    double margin_atr
) {
    StopRunResult result;
    if (lookback <= 0 || !atr || series.size() < static_cast<std::size_t>(lookback) + 1) {
        return result;
    }

    const auto& bars = series.bars;
    const Bar& current = bars.back();
    auto window_begin = bars.end() - 1 - lookback;
    auto window_end = bars.end() - 1;

    result.determined = true;
    result.prior_high = std::max_element(window_begin, window_end,
        [](const Bar& a, const Bar& b) { return a.high < b.high; })->high;
    result.prior_low = std::min_element(window_begin, window_end,
        [](const Bar& a, const Bar& b) { return a.low < b.low; })->low;
    result.margin = margin_atr * *atr;

    const bool swept_high = current.high > result.prior_high + result.margin;
    const bool swept_low = current.low < result.prior_low - result.margin;

    // An outside bar through both extremes carries no directional message
    if (swept_high && swept_low) {
        spdlog::debug("Stop-run ignored: bar swept both {:.2f} and {:.2f}", result.prior_high, result.prior_low);
        return result;
    }

    if (swept_high && current.close < result.prior_high) {
        result.kind = StopRun::Bearish;
    } else if (swept_low && current.close > result.prior_low) {
        result.kind = StopRun::Bullish;
    }

    return result;
}

} // namespace patterns
