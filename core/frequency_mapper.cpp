#include "frequency_mapper.hpp"

#include <algorithm>
#include <cmath>

namespace waterfall {

FrequencyRange display_frequency_range(double sample_rate) {
    FrequencyRange r;
    r.nyquist = sample_rate > 0.0 ? sample_rate / 2.0 : 0.0;
    r.fmax = std::min(16000.0, r.nyquist);
    r.fmin = std::max(20.0, r.nyquist / 20000.0);
    if (r.fmin >= r.fmax) r.fmin = r.fmax * 0.9999;
    return r;
}

double hz_to_mel(double hz) {
    return 2595.0 * std::log10(1.0 + hz / 700.0);
}

double mel_to_hz(double mel) {
    return 700.0 * (std::pow(10.0, mel / 2595.0) - 1.0);
}

namespace {

class LinearScale : public FrequencyScale {
public:
    explicit LinearScale(const FrequencyRange& range) : FrequencyScale(range) {}

    double hz_at(double t) const override {
        return range_.fmin + t * (range_.fmax - range_.fmin);
    }

    double position_of(double hz) const override {
        const double span = range_.fmax - range_.fmin;
        return span > 0.0 ? (hz - range_.fmin) / span : 0.0;
    }
};

class MelScale : public FrequencyScale {
public:
    explicit MelScale(const FrequencyRange& range)
        : FrequencyScale(range),
          mel_min_(hz_to_mel(range.fmin)),
          mel_span_(std::max(1e-9, hz_to_mel(range.fmax) - mel_min_)) {}

    double hz_at(double t) const override {
        return mel_to_hz(mel_min_ + t * mel_span_);
    }

    double position_of(double hz) const override {
        return (hz_to_mel(hz) - mel_min_) / mel_span_;
    }

private:
    double mel_min_;
    double mel_span_;
};

} // namespace

std::unique_ptr<FrequencyScale> make_frequency_scale(FrequencyScaleMode mode, const FrequencyRange& range) {
    if (mode == FrequencyScaleMode::Mel) return std::make_unique<MelScale>(range);
    return std::make_unique<LinearScale>(range);
}

float apply_contrast_luminosity(float v, float contrast, float luminosity) {
    v = ((v - 0.5f) * contrast + 0.5f) + luminosity;
    return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v);
}

void FrequencyMapper::configure(FrequencyScaleMode mode, int width, double sample_rate, int bin_count) {
    width = std::max(0, width);
    bin_count = std::max(0, bin_count);
    if (mode == mode_ && width == width_ && sample_rate == sample_rate_ && bin_count == bin_count_
        && static_cast<int>(bin_index_.size()) == width_) {
        return;
    }
    mode_ = mode;
    width_ = width;
    sample_rate_ = sample_rate;
    bin_count_ = bin_count;
    rebuild();
}

void FrequencyMapper::rebuild() {
    range_ = display_frequency_range(sample_rate_);
    frequency_hz_.assign(static_cast<size_t>(width_), 0.0);
    bin_index_.assign(static_cast<size_t>(width_), 0.0);
    if (width_ <= 0 || bin_count_ <= 0 || !(range_.nyquist > 0.0)) return;

    const auto scale = make_frequency_scale(mode_, range_);
    const double last_bin = static_cast<double>(bin_count_ - 1);
    const double denom = width_ > 1 ? static_cast<double>(width_ - 1) : 1.0;
    for (int x = 0; x < width_; ++x) {
        const double t = static_cast<double>(x) / denom;
        const double f = scale->hz_at(t);
        frequency_hz_[x] = f;
        bin_index_[x] = std::clamp((f / range_.nyquist) * last_bin, 0.0, last_bin);
    }
}

double FrequencyMapper::bin_index(int x) const {
    if (x < 0 || x >= static_cast<int>(bin_index_.size())) return 0.0;
    return bin_index_[x];
}

double FrequencyMapper::frequency_at_column(int x) const {
    if (x < 0 || x >= static_cast<int>(frequency_hz_.size())) return 0.0;
    return frequency_hz_[x];
}

float FrequencyMapper::sample(const NormalizedRow& row, int x) const {
    const int bins = static_cast<int>(row.size());
    if (bins == 0) return 0.0f;
    const double idx = std::min(bin_index(x), static_cast<double>(bins - 1));
    const int i0 = static_cast<int>(std::floor(idx));
    const int i1 = std::min(bins - 1, i0 + 1);
    const float t = static_cast<float>(idx - i0);
    return row[i0] * (1.0f - t) + row[i1] * t;
}

void FrequencyMapper::map_row(const NormalizedRow& row,
                              const VisualAdjust& adjust,
                              const ColorScheme& scheme,
                              PixelRow& out) const {
    out.resize(static_cast<size_t>(width_));
    for (int x = 0; x < width_; ++x) {
        const float v = apply_contrast_luminosity(sample(row, x), adjust.contrast, adjust.luminosity);
        out[x] = color_from_scheme(scheme, v);
    }
}

} // namespace waterfall
