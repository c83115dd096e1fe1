#pragma once

#include <cstddef>
#include <optional>

#include "app_settings.hpp"
#include "cadence.hpp"
#include "frame_types.hpp"
#include "frequency_mapper.hpp"
#include "magnitude_source.hpp"
#include "row_queue.hpp"

namespace waterfall {

// Signal-to-pixel pipeline: cadence -> sample -> normalize -> map.
// The host owns the driving loop and calls tick() once per opportunity
// (display refresh while visible, an interval timer while hidden).
class WaterfallPipeline {
public:
    static constexpr int hidden_max_rows_per_second = 10;
    static constexpr double hidden_min_interval_s = 0.05;

    explicit WaterfallPipeline(MagnitudeSource& source,
                               std::size_t queue_capacity = RowQueue<PixelRow>::default_capacity);

    void start(double now);
    // Halts production and discards queued rows
    void stop();
    bool running() const { return cadence_.running(); }

    // Hidden: rows go to the queue at a reduced rate. Visible again: the
    // schedule is re-anchored at now; queued rows stay until drain().
    void set_visible(bool visible, double now);
    bool visible() const { return visible_; }

    // At most one row per call. Visible: the row is returned. Hidden: the row
    // is queued and nothing is returned. A width change drops queued rows
    // mapped at the old width.
    std::optional<PixelRow> tick(double now, const Settings& settings, int width);

    // FIFO delivery of queued rows, each exactly once
    template<typename Sink>
    std::size_t drain(Sink&& sink) { return queue_.drain(sink); }
    void discard_queue() { queue_.clear(); }

    std::size_t queued() const { return queue_.size(); }
    std::size_t dropped() const { return queue_.dropped(); }
    std::size_t rows_produced() const { return rows_produced_; }

    double rows_per_second(const Settings& settings) const;
    static double hidden_interval_s(int rows_per_second);

    AxisContext axis_context(const Settings& settings, double now) const;
    const FrequencyMapper& mapper() const { return mapper_; }
    const CadenceScheduler& cadence() const { return cadence_; }

private:
    MagnitudeSource& source_;
    CadenceScheduler cadence_;
    FrequencyMapper mapper_;
    RowQueue<PixelRow> queue_;
    NormalizedRow normalized_;
    bool visible_ = true;
    int queued_width_ = 0;
    double session_start_ = 0.0;
    std::size_t rows_produced_ = 0;
};

} // namespace waterfall
