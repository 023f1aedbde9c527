#include "yield_bias.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

YieldBiasAnalyzer::YieldBiasAnalyzer(int window_bars, std::chrono::seconds alignment_tolerance)
    : window_bars_(window_bars), alignment_tolerance_(alignment_tolerance) {}

YieldAnalysis YieldBiasAnalyzer::analyze(const TimeframeSeries& fast, const MacroSeries& yield) const {
    YieldAnalysis analysis;
    if (yield.empty() || fast.size() < static_cast<std::size_t>(window_bars_) + 1) {
        return analysis;
    }

    const Bar& start = fast.bars[fast.size() - 1 - window_bars_];
    const Bar& end = fast.last();

    auto yield_start = macro_value_at(yield, start.timestamp, alignment_tolerance_);
    auto yield_end = macro_value_at(yield, end.timestamp, alignment_tolerance_);
    if (!yield_start || !yield_end) {
        spdlog::debug("Yield series not aligned within {}s of the price window, factor excluded",
                      alignment_tolerance_.count());
        return analysis;
    }

    analysis.determined = true;
    analysis.price_change = end.close - start.close;
    analysis.yield_change = *yield_end - *yield_start;
    analysis.price_direction = util::sign(analysis.price_change);
    analysis.yield_direction = util::sign(analysis.yield_change);
    return analysis;
}

int YieldBiasAnalyzer::support(const YieldAnalysis& analysis, Bias bias) {
    const int bias_dir = bias_sign(bias);
    if (!analysis.determined || bias_dir == 0) {
        return 0;
    }

    if (analysis.price_direction != 0 && analysis.yield_direction == analysis.price_direction) {
        return -1;
    }

    if (analysis.price_direction == bias_dir && analysis.yield_direction == -analysis.price_direction) {
        return 1;
    }

    return 0;
}
