#include "fft/fft_utils.hpp"
#include <cmath>
#include <utility>

namespace waterfall::fft {

bool is_power_of_two(int n) {
    return n > 0 && (n & (n - 1)) == 0;
}

FftPlan::FftPlan(int size) : size_(is_power_of_two(size) ? size : 0) {
    const int n = size_;
    if (n <= 1) return;

    int bits = 0; while ((1 << bits) < n) ++bits;
    bitrev_.resize(n);
    for (int i = 0; i < n; ++i) {
        unsigned int v = static_cast<unsigned int>(i);
        unsigned int r = 0;
        for (int b = 0; b < bits; ++b) { r = (r << 1) | (v & 1u); v >>= 1; }
        bitrev_[i] = static_cast<int>(r);
    }

    const double two_pi = 6.28318530717958647692;
    for (int len = 2; len <= n; len <<= 1) {
        const int half = len / 2;
        std::vector<std::complex<float>> stage(half);
        // Direct evaluation per k keeps large sizes accurate
        for (int k = 0; k < half; ++k) {
            const double angle = -two_pi * static_cast<double>(k) / static_cast<double>(len);
            stage[k] = std::complex<float>(static_cast<float>(std::cos(angle)), static_cast<float>(std::sin(angle)));
        }
        twiddles_.push_back(std::move(stage));
    }
}

void FftPlan::forward(std::vector<std::complex<float>>& data) const {
    const int n = size_;
    if (n <= 1 || static_cast<int>(data.size()) != n) return;

    for (int i = 0; i < n; ++i) {
        const int j = bitrev_[i];
        if (j > i) std::swap(data[i], data[j]);
    }

    int stage_index = 0;
    for (int len = 2; len <= n; len <<= 1, ++stage_index) {
        const auto& W = twiddles_[stage_index];
        const int half = len / 2;
        for (int i = 0; i < n; i += len) {
            for (int k = 0; k < half; ++k) {
                const auto u = data[i + k];
                const auto v = data[i + k + half] * W[k];
                data[i + k] = u + v;
                data[i + k + half] = u - v;
            }
        }
    }
}

std::vector<float> hann_window(int n) {
    std::vector<float> w(n > 0 ? n : 0, 1.0f);
    if (n <= 1) return w;
    const double two_pi = 6.28318530717958647692;
    for (int i = 0; i < n; ++i) {
        w[i] = static_cast<float>(0.5 * (1.0 - std::cos(two_pi * i / (n - 1))));
    }
    return w;
}

} // namespace waterfall::fft
