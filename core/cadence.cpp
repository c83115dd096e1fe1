#include "cadence.hpp"

namespace waterfall {

void CadenceScheduler::start(double now) {
    running_ = true;
    next_due_ = now;
    fired_ = 0;
    resyncs_ = 0;
}

void CadenceScheduler::stop() {
    running_ = false;
}

void CadenceScheduler::rearm(double now) {
    next_due_ = now;
}

bool CadenceScheduler::poll(double now, double rows_per_second) {
    if (!running_ || !(rows_per_second > 0.0)) return false;
    if (now + tolerance_s < next_due_) return false;

    if (now - next_due_ > max_lag_s) {
        next_due_ = now;
        ++resyncs_;
    }
    next_due_ += 1.0 / rows_per_second;
    ++fired_;
    return true;
}

} // namespace waterfall
