#pragma once

#include "types.hpp"
#include <chrono>

class YieldBiasAnalyzer {
public:
    YieldBiasAnalyzer(int window_bars, std::chrono::seconds alignment_tolerance);

    // Price and yield direction over the last window_bars fast bars. Yield
    // values are matched nearest-preceding; a gap beyond the tolerance
    // leaves the analysis undetermined for this cycle.
    YieldAnalysis analyze(const TimeframeSeries& fast, const MacroSeries& yield) const;

    // +1 when price moved with the bias and yields moved inversely,
    // -1 when yields moved with price, 0 otherwise
    static int support(const YieldAnalysis& analysis, Bias bias);

private:
    int window_bars_;
    std::chrono::seconds alignment_tolerance_;
};
