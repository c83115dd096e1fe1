#pragma once

#include <atomic>
#include <complex>
#include <mutex>
#include <vector>

#include "fft/fft_utils.hpp"
#include "magnitude_source.hpp"

namespace waterfall::dsp {

struct AnalyserConfig {
    int fft_size = 2048;
    double sample_rate = 48000.0;
    float min_db = -100.0f;
    float max_db = -20.0f;
    MagnitudeEncoding encoding = MagnitudeEncoding::Level;
};

// Magnitude source fed by the capture thread. Keeps the newest fft_size
// samples; sample() windows them, transforms, and reports fft_size/2 bins
// from 0 Hz up to (not including) Nyquist.
class AnalyserSource : public MagnitudeSource {
public:
    explicit AnalyserSource(const AnalyserConfig& cfg = AnalyserConfig{});

    // Drops buffered audio when the size or rate changes; the capture clock
    // keeps running so the cadence never sees time go backwards
    void configure(double sample_rate, int fft_size);
    void set_input_gain(float gain) { gain_.store(gain); }
    float input_gain() const { return gain_.load(); }

    // Real-time thread: minimal locking
    void push_samples(const float* input, int count);

    // Driving-loop thread
    RawFrame sample() override;
    double sample_rate() const override;
    int bin_count() const override;

    // Seconds of audio received so far (capture-domain clock)
    double capture_time() const;
    void reset();

private:
    void rebuild_locked();

    mutable std::mutex mutex_;
    AnalyserConfig cfg_;
    std::vector<float> ring_;
    std::size_t write_pos_ = 0;
    double captured_seconds_ = 0.0;
    std::atomic<float> gain_{1.0f};

    fft::FftPlan plan_;
    std::vector<float> window_;
    std::vector<float> snapshot_;
    std::vector<std::complex<float>> spectrum_;
};

} // namespace waterfall::dsp
