#pragma once

#include <string>
#include <vector>
#include "app_settings.hpp"
#include "frame_types.hpp"

namespace waterfall {

struct AxisTick {
    float position = 0.0f; // pixels: x for frequency ticks, y (from top) for time ticks
    double value = 0.0;    // Hz or seconds
    std::string label;
};

struct AxisLayout {
    std::vector<AxisTick> frequency;
    std::vector<AxisTick> time;
    double frequency_step_hz = 0.0;  // 0 in mel mode (fixed candidate set)
    double time_step_s = 0.0;
};

// Smallest of {10,20,50,...,10000} Hz covering fmax / clamp(width/120, 6, 12)
double select_frequency_step(int width, double fmax);

// Smallest of {0.2,0.5,1,...,3600} s covering (height/rps) / clamp(height/80, 4, 12)
double select_time_step(int height, double rows_per_second);

std::string format_frequency_label(double hz);
std::string format_time_label(double seconds, double step);

// Ticks are placed with the same scale the frequency mapper uses, so a tick at
// f sits over the column that shows f. Degenerate inputs yield no ticks.
std::vector<AxisTick> frequency_ticks(FrequencyScaleMode mode, const AxisContext& ctx, int width, double* step_out = nullptr);
std::vector<AxisTick> time_ticks(const AxisContext& ctx, int height, double* step_out = nullptr);

AxisLayout layout_axes(FrequencyScaleMode mode, const AxisContext& ctx, int width, int height);

} // namespace waterfall
