#include "axis_ticks.hpp"
#include "frequency_mapper.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>

namespace waterfall {

static constexpr std::array<double, 10> nice_frequency_steps = {10,20,50,100,200,500,1000,2000,5000,10000};
static constexpr std::array<double, 13> nice_time_steps = {0.2,0.5,1,2,5,10,30,60,120,300,600,1800,3600};
static constexpr std::array<double, 17> mel_tick_frequencies = {20,50,100,200,300,500,700,1000,1500,2000,3000,5000,8000,10000,15000,16000,20000};

template <size_t N>
static double first_at_least(const std::array<double, N>& candidates, double raw) {
    for (double s : candidates) {
        if (s >= raw) return s;
    }
    return candidates.back();
}

double select_frequency_step(int width, double fmax) {
    const int target_ticks = std::clamp(width / 120, 6, 12);
    return first_at_least(nice_frequency_steps, fmax / target_ticks);
}

double select_time_step(int height, double rows_per_second) {
    if (!(rows_per_second > 0.0) || height <= 0) return nice_time_steps.front();
    const double seconds_visible = height / rows_per_second;
    const int target_ticks = std::clamp(height / 80, 4, 12);
    return first_at_least(nice_time_steps, seconds_visible / target_ticks);
}

std::string format_frequency_label(double hz) {
    char buf[32];
    if (hz >= 1000.0) {
        const bool whole = std::fmod(hz, 1000.0) == 0.0;
        std::snprintf(buf, sizeof(buf), whole ? "%.0f kHz" : "%.1f kHz", hz / 1000.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.0f Hz", std::round(hz));
    }
    return buf;
}

std::string format_time_label(double seconds, double step) {
    char buf[32];
    if (seconds >= 60.0) {
        const bool whole = std::fmod(seconds, 60.0) == 0.0;
        std::snprintf(buf, sizeof(buf), whole ? "%.0f min" : "%.1f min", seconds / 60.0);
    } else {
        std::snprintf(buf, sizeof(buf), step < 1.0 ? "%.1f s" : "%.0f s", seconds);
    }
    return buf;
}

std::vector<AxisTick> frequency_ticks(FrequencyScaleMode mode, const AxisContext& ctx, int width, double* step_out) {
    std::vector<AxisTick> ticks;
    if (step_out) *step_out = 0.0;
    if (width <= 1 || !(ctx.sample_rate > 0.0)) return ticks;

    const FrequencyRange range = display_frequency_range(ctx.sample_rate);
    const auto scale = make_frequency_scale(mode, range);
    const float span_px = static_cast<float>(width - 1);
    auto add_tick = [&](double f) {
        const float x = static_cast<float>(scale->position_of(f)) * span_px;
        ticks.push_back(AxisTick{x, f, format_frequency_label(f)});
    };

    if (mode == FrequencyScaleMode::Linear) {
        const double step = select_frequency_step(width, range.fmax);
        if (step_out) *step_out = step;
        const long first = static_cast<long>(std::ceil(range.fmin / step));
        for (long k = first; k * step <= range.fmax + 1e-6; ++k) {
            add_tick(k * step);
        }
    } else {
        // Mel spacing is non-uniform, so use a fixed set of perceptual frequencies
        for (double f : mel_tick_frequencies) {
            if (f < range.fmin || f > range.fmax) continue;
            add_tick(f);
        }
    }
    return ticks;
}

std::vector<AxisTick> time_ticks(const AxisContext& ctx, int height, double* step_out) {
    std::vector<AxisTick> ticks;
    if (step_out) *step_out = 0.0;
    if (height <= 0 || !(ctx.rows_per_second > 0.0)) return ticks;

    const double step = select_time_step(height, ctx.rows_per_second);
    if (step_out) *step_out = step;
    // Row y is y / rows_per_second seconds old; the newest row is at the top
    const double seconds_visible = height / ctx.rows_per_second;
    for (long k = 0; k * step <= seconds_visible + 0.001; ++k) {
        const double t = k * step;
        ticks.push_back(AxisTick{static_cast<float>(t * ctx.rows_per_second), t, format_time_label(t, step)});
    }
    return ticks;
}

AxisLayout layout_axes(FrequencyScaleMode mode, const AxisContext& ctx, int width, int height) {
    AxisLayout layout;
    if (width <= 0 || height <= 0) return layout;
    layout.frequency = frequency_ticks(mode, ctx, width, &layout.frequency_step_hz);
    layout.time = time_ticks(ctx, height, &layout.time_step_s);
    return layout;
}

} // namespace waterfall
