#include "pipeline.hpp"
#include "color_map.hpp"
#include "normalizer.hpp"

#include <algorithm>
#include <utility>

namespace waterfall {

WaterfallPipeline::WaterfallPipeline(MagnitudeSource& source, std::size_t queue_capacity)
    : source_(source), queue_(queue_capacity) {}

void WaterfallPipeline::start(double now) {
    session_start_ = now;
    rows_produced_ = 0;
    cadence_.start(now);
}

void WaterfallPipeline::stop() {
    cadence_.stop();
    queue_.clear();
    queued_width_ = 0;
}

void WaterfallPipeline::set_visible(bool visible, double now) {
    const bool was_visible = visible_;
    visible_ = visible;
    if (visible_ && !was_visible) cadence_.rearm(now);
}

double WaterfallPipeline::rows_per_second(const Settings& settings) const {
    const double rate = std::clamp(settings.rows_per_second, limits::min_rows_per_second, limits::max_rows_per_second);
    return visible_ ? rate : std::min<double>(hidden_max_rows_per_second, rate);
}

double WaterfallPipeline::hidden_interval_s(int rows_per_second) {
    const int rate = std::clamp(rows_per_second, 1, hidden_max_rows_per_second);
    return std::max(hidden_min_interval_s, 1.0 / rate);
}

std::optional<PixelRow> WaterfallPipeline::tick(double now, const Settings& settings, int width) {
    if (width <= 0) return std::nullopt;
    if (!queue_.empty() && width != queued_width_) queue_.clear();
    if (!cadence_.poll(now, rows_per_second(settings))) return std::nullopt;

    const RawFrame frame = source_.sample();
    Normalizer::normalize(frame, settings.dynamic_range_db, normalized_);

    const auto& schemes = color_schemes();
    const int scheme_idx = std::clamp(settings.color_scheme_idx, 0, static_cast<int>(schemes.size()) - 1);
    mapper_.configure(settings.frequency_scale, width, frame.sample_rate, frame.bin_count());

    PixelRow row;
    mapper_.map_row(normalized_, VisualAdjust{settings.contrast, settings.luminosity}, schemes[scheme_idx], row);
    ++rows_produced_;

    if (visible_) return row;
    queue_.push(std::move(row));
    queued_width_ = width;
    return std::nullopt;
}

AxisContext WaterfallPipeline::axis_context(const Settings& settings, double now) const {
    AxisContext ctx;
    ctx.sample_rate = source_.sample_rate();
    ctx.bin_count = source_.bin_count();
    ctx.rows_per_second = settings.rows_per_second;
    ctx.session_start = session_start_;
    ctx.current_time = now;
    return ctx;
}

} // namespace waterfall
