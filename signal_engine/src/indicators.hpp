#pragma once

#include "types.hpp"
#include <optional>

// Pure indicator functions. Insufficient history yields nullopt or an
// Undetermined label, never an exception.
namespace indicators {

enum class MovingAverageKind { Simple, Exponential };

MovingAverageKind moving_average_kind_from_string(const std::string& kind);

// Mean of the last `period` closes
std::optional<double> simple_moving_average(const TimeframeSeries& series, int period);

// Recursive EMA over the whole series, seeded with the first close
std::optional<double> exponential_moving_average(const TimeframeSeries& series, int period);

// Sign of (last close - MA(period))
TrendDirection trend_direction(const TimeframeSeries& series, int period,
                               MovingAverageKind kind = MovingAverageKind::Simple);

double true_range(const Bar& bar, const Bar& previous);

// Mean true range of the last `window` bars; needs window + 1 bars
std::optional<double> average_true_range(const TimeframeSeries& series, int window);

// Bounded [0, 100]; needs period + 1 bars
std::optional<double> relative_strength_index(const TimeframeSeries& series, int period);

struct VsaParams {
    int baseline_window = 20;
    double volume_spike_ratio = 1.5;
    double narrow_range_ratio = 0.5;
};

// Classifies the last bar against the prevailing trend using its volume
// and range relative to the preceding baseline_window bars
VsaLabel classify_vsa(const TimeframeSeries& series, TrendDirection trend, const VsaParams& params);

// Last bar's body exceeds body_ratio x mean range of the last `window` bars
bool is_expansion_bar(const TimeframeSeries& series, int window, double body_ratio);

} // namespace indicators
