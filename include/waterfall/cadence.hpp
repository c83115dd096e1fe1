#pragma once

#include <cstddef>

namespace waterfall {

// Decides when the next row is due. Time comes from the capture domain
// (seconds), never from the wall clock. Each firing moves the due time
// forward by exactly 1/rate from the previous due time, so late frames do
// not accumulate drift.
class CadenceScheduler {
public:
    // Early firing allowance that absorbs refresh-rate jitter
    static constexpr double tolerance_s = 0.002;
    // Falling further behind than this re-anchors the schedule at now
    static constexpr double max_lag_s = 1.0;

    void start(double now);
    void stop();
    bool running() const { return running_; }

    // Re-anchor without counting as a restart (visibility changes)
    void rearm(double now);

    // Returns true at most once per call; false has no side effects
    bool poll(double now, double rows_per_second);

    double next_due() const { return next_due_; }
    std::size_t fired() const { return fired_; }
    std::size_t resyncs() const { return resyncs_; }

private:
    bool running_ = false;
    double next_due_ = 0.0;
    std::size_t fired_ = 0;
    std::size_t resyncs_ = 0;
};

} // namespace waterfall
