#pragma once

#include <complex>
#include <vector>

namespace waterfall::fft {

// Iterative radix-2 transform with precomputed bit-reversal and per-stage
// twiddles. Size must be a power of two.
class FftPlan {
public:
    explicit FftPlan(int size = 0);

    int size() const { return size_; }
    void forward(std::vector<std::complex<float>>& data) const;

private:
    int size_ = 0;
    std::vector<int> bitrev_;
    std::vector<std::vector<std::complex<float>>> twiddles_; // len/2 per stage
};

bool is_power_of_two(int n);

// Symmetric Hann window of length n
std::vector<float> hann_window(int n);

} // namespace waterfall::fft
