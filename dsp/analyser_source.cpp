#include "analyser_source.hpp"

#include <algorithm>
#include <cmath>

namespace waterfall::dsp {

AnalyserSource::AnalyserSource(const AnalyserConfig& cfg) : cfg_(cfg) {
    if (!fft::is_power_of_two(cfg_.fft_size)) cfg_.fft_size = 2048;
    if (!(cfg_.sample_rate > 0.0)) cfg_.sample_rate = 48000.0;
    std::lock_guard<std::mutex> lock(mutex_);
    rebuild_locked();
}

void AnalyserSource::rebuild_locked() {
    ring_.assign(static_cast<size_t>(cfg_.fft_size), 0.0f);
    write_pos_ = 0;
    plan_ = fft::FftPlan(cfg_.fft_size);
    window_ = fft::hann_window(cfg_.fft_size);
    snapshot_.assign(static_cast<size_t>(cfg_.fft_size), 0.0f);
    spectrum_.assign(static_cast<size_t>(cfg_.fft_size), std::complex<float>(0.0f, 0.0f));
}

void AnalyserSource::configure(double sample_rate, int fft_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fft::is_power_of_two(fft_size)) fft_size = cfg_.fft_size;
    if (!(sample_rate > 0.0)) sample_rate = cfg_.sample_rate;
    if (fft_size == cfg_.fft_size && sample_rate == cfg_.sample_rate) return;
    cfg_.fft_size = fft_size;
    cfg_.sample_rate = sample_rate;
    rebuild_locked();
}

void AnalyserSource::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fill(ring_.begin(), ring_.end(), 0.0f);
    write_pos_ = 0;
    captured_seconds_ = 0.0;
}

void AnalyserSource::push_samples(const float* input, int count) {
    if (!input || count <= 0) return;
    const float gain = gain_.load();
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = ring_.size();
    for (int i = 0; i < count; ++i) {
        ring_[write_pos_] = input[i] * gain;
        write_pos_ = (write_pos_ + 1) % n;
    }
    captured_seconds_ += static_cast<double>(count) / cfg_.sample_rate;
}

double AnalyserSource::sample_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_.sample_rate;
}

int AnalyserSource::bin_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_.fft_size / 2;
}

double AnalyserSource::capture_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return captured_seconds_;
}

RawFrame AnalyserSource::sample() {
    RawFrame frame;
    int n = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        n = cfg_.fft_size;
        // Oldest sample first: the ring is full-length, write_pos_ is the oldest slot
        const size_t first = ring_.size() - write_pos_;
        std::copy(ring_.begin() + write_pos_, ring_.end(), snapshot_.begin());
        std::copy(ring_.begin(), ring_.begin() + write_pos_, snapshot_.begin() + first);
        frame.encoding = cfg_.encoding;
        frame.min_db = cfg_.min_db;
        frame.max_db = cfg_.max_db;
        frame.sample_rate = cfg_.sample_rate;
        frame.capture_time = captured_seconds_;
    }

    for (int i = 0; i < n; ++i) spectrum_[i] = std::complex<float>(snapshot_[i] * window_[i], 0.0f);
    plan_.forward(spectrum_);

    const int bins = n / 2;
    const float inv_n = 1.0f / static_cast<float>(n);
    const float range_db = frame.max_db - frame.min_db;
    if (frame.encoding == MagnitudeEncoding::Level) {
        frame.levels.resize(static_cast<size_t>(bins));
    } else {
        frame.decibels.resize(static_cast<size_t>(bins));
    }
    for (int k = 0; k < bins; ++k) {
        const float mag = std::abs(spectrum_[k]) * inv_n;
        const float db = mag > 0.0f ? 20.0f * std::log10(mag) : -INFINITY;
        if (frame.encoding == MagnitudeEncoding::Level) {
            float scaled = range_db > 0.0f ? 255.0f * (db - frame.min_db) / range_db : 0.0f;
            scaled = std::clamp(std::floor(scaled), 0.0f, 255.0f);
            frame.levels[k] = static_cast<std::uint8_t>(scaled);
        } else {
            frame.decibels[k] = db;
        }
    }
    return frame;
}

} // namespace waterfall::dsp
