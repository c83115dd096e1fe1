#include "analyser_source.hpp"
#include "fft/fft_utils.hpp"
#include "test_check.hpp"

#include <cmath>
#include <complex>
#include <vector>

using namespace waterfall;

static constexpr double two_pi = 6.28318530717958647692;

static std::vector<float> tone(double hz, double sample_rate, int n, float amplitude) {
    std::vector<float> out(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        out[i] = amplitude * static_cast<float>(std::sin(two_pi * hz * i / sample_rate));
    }
    return out;
}

static int peak_bin(const RawFrame& f) {
    int best = 0;
    for (int k = 1; k < f.bin_count(); ++k) {
        if (f.levels[k] > f.levels[best]) best = k;
    }
    return best;
}

int main() {
    // Transform of a unit impulse is flat; a bin-centred cosine lands in its bin
    {
        CHECK(fft::is_power_of_two(1024));
        CHECK(!fft::is_power_of_two(1000));
        CHECK(!fft::is_power_of_two(0));

        fft::FftPlan plan(16);
        CHECK(plan.size() == 16);
        std::vector<std::complex<float>> x(16, {0.0f, 0.0f});
        x[0] = {1.0f, 0.0f};
        plan.forward(x);
        for (const auto& v : x) CHECK_NEAR(std::abs(v), 1.0, 1e-5);

        std::vector<std::complex<float>> c(64);
        for (int i = 0; i < 64; ++i) c[i] = {static_cast<float>(std::cos(two_pi * 5 * i / 64)), 0.0f};
        fft::FftPlan plan64(64);
        plan64.forward(c);
        CHECK_NEAR(std::abs(c[5]), 32.0, 1e-3);
        CHECK_NEAR(std::abs(c[6]), 0.0, 1e-3);

        const auto w = fft::hann_window(8);
        CHECK(w.size() == 8);
        CHECK_NEAR(w[0], 0.0, 1e-6);
        CHECK_NEAR(w[7], 0.0, 1e-6);
        CHECK_NEAR(w[3], w[4], 1e-6);
    }

    // Pure tone lands in the expected bin
    {
        dsp::AnalyserSource src;
        src.configure(48000.0, 1024);
        CHECK(src.bin_count() == 512);
        const double hz = 64.0 * 48000.0 / 1024.0; // bin 64
        const auto samples = tone(hz, 48000.0, 2048, 0.01f);
        src.push_samples(samples.data(), static_cast<int>(samples.size()));
        const RawFrame f = src.sample();
        CHECK(f.bin_count() == 512);
        CHECK(f.encoding == MagnitudeEncoding::Level);
        CHECK_NEAR(f.sample_rate, 48000.0, 1e-9);
        CHECK(peak_bin(f) == 64);
        CHECK(f.levels[64] > 100);
        CHECK(f.levels[200] < f.levels[64] / 4);
        CHECK_NEAR(src.capture_time(), 2048.0 / 48000.0, 1e-9);
        CHECK_NEAR(f.capture_time, src.capture_time(), 1e-12);
    }

    // Silence maps to the bottom level
    {
        dsp::AnalyserSource src;
        src.configure(48000.0, 512);
        std::vector<float> zeros(1024, 0.0f);
        src.push_samples(zeros.data(), static_cast<int>(zeros.size()));
        const RawFrame f = src.sample();
        bool all_zero = true;
        for (auto v : f.levels) if (v != 0) all_zero = false;
        CHECK(all_zero);
    }

    // Input gain raises the level of the same signal
    {
        const auto samples = tone(3000.0, 48000.0, 2048, 0.001f);
        dsp::AnalyserSource quiet, loud;
        quiet.configure(48000.0, 1024);
        loud.configure(48000.0, 1024);
        loud.set_input_gain(10.0f);
        CHECK_NEAR(loud.input_gain(), 10.0, 1e-6);
        quiet.push_samples(samples.data(), static_cast<int>(samples.size()));
        loud.push_samples(samples.data(), static_cast<int>(samples.size()));
        const RawFrame fq = quiet.sample();
        const RawFrame fl = loud.sample();
        CHECK(fl.levels[64] > fq.levels[64]);
        // 20 dB more over an 80 dB span of 255 levels
        CHECK_NEAR(static_cast<double>(fl.levels[64]) - fq.levels[64], 255.0 * 20.0 / 80.0, 2.0);
    }

    // Decibel encoding reports dB directly
    {
        dsp::AnalyserConfig cfg;
        cfg.fft_size = 1024;
        cfg.encoding = MagnitudeEncoding::Decibels;
        dsp::AnalyserSource src(cfg);
        const auto samples = tone(3000.0, 48000.0, 1024, 1.0f);
        src.push_samples(samples.data(), static_cast<int>(samples.size()));
        const RawFrame f = src.sample();
        CHECK(f.decibels.size() == 512);
        CHECK(f.levels.empty());
        // Hann coherent gain 0.5, half the energy in the positive bin
        CHECK_NEAR(f.decibels[64], 20.0 * std::log10(0.25), 0.5);
    }

    // Reconfiguring keeps the capture clock moving forward
    {
        dsp::AnalyserSource src;
        src.configure(48000.0, 1024);
        std::vector<float> block(4800, 0.0f);
        src.push_samples(block.data(), static_cast<int>(block.size()));
        const double before = src.capture_time();
        src.configure(48000.0, 4096);
        CHECK(src.bin_count() == 2048);
        CHECK_NEAR(src.capture_time(), before, 1e-12);
        src.configure(48000.0, 1000); // not a power of two, ignored
        CHECK(src.bin_count() == 2048);
        src.reset();
        CHECK_NEAR(src.capture_time(), 0.0, 1e-12);
    }

    return finish("analyser_source_test");
}
