#pragma once

#include "types.hpp"
#include <optional>

namespace patterns {

// +1 both timeframes bullish, -1 both bearish, 0 otherwise
int multi_timeframe_alignment(TrendDirection fast, TrendDirection slow);

struct StopRunResult {
    StopRun kind = StopRun::None;
    bool determined = false;
    double prior_high = 0.0;
    double prior_low = 0.0;
    double margin = 0.0;
};

// Sweep-and-reject of the prior `lookback` bars' extreme (current bar excluded).
// The sweep must exceed the extreme by margin_atr x atr and close back inside.
StopRunResult detect_stop_run(
    const TimeframeSeries& series,
    int lookback,
    const std::optional<double>& atr,
    double margin_atr
);

} // namespace patterns
