#pragma once

#include <memory>
#include <vector>
#include "app_settings.hpp"
#include "color_map.hpp"
#include "frame_types.hpp"

namespace waterfall {

// Frequencies shown on the horizontal axis
struct FrequencyRange {
    double fmin = 20.0;
    double fmax = 16000.0;
    double nyquist = 24000.0;
};

// fmin = max(20, nyquist/20000), fmax = min(16000, nyquist).
// A collapsed range is widened to [fmax*0.9999, fmax].
FrequencyRange display_frequency_range(double sample_rate);

double hz_to_mel(double hz);
double mel_to_hz(double mel);

// Position along the frequency axis as a fraction t in [0,1] of the range
class FrequencyScale {
public:
    virtual ~FrequencyScale() = default;

    virtual double hz_at(double t) const = 0;
    virtual double position_of(double hz) const = 0;
    const FrequencyRange& range() const { return range_; }

protected:
    explicit FrequencyScale(const FrequencyRange& range) : range_(range) {}
    FrequencyRange range_;
};

std::unique_ptr<FrequencyScale> make_frequency_scale(FrequencyScaleMode mode, const FrequencyRange& range);

// v' = clamp01(((v - 0.5) * contrast + 0.5) + luminosity)
float apply_contrast_luminosity(float v, float contrast, float luminosity);

struct VisualAdjust {
    float contrast = 1.0f;
    float luminosity = 0.0f;
};

// Resamples a bin-indexed row onto pixel columns. The column -> bin table is
// rebuilt only when mode, width, sample rate or bin count change, so the scale
// is dispatched once per configuration instead of once per pixel.
class FrequencyMapper {
public:
    void configure(FrequencyScaleMode mode, int width, double sample_rate, int bin_count);

    int width() const { return width_; }
    int bin_count() const { return bin_count_; }
    FrequencyScaleMode mode() const { return mode_; }
    const FrequencyRange& range() const { return range_; }

    // Fractional bin index for column x, always in [0, bin_count-1]
    double bin_index(int x) const;
    double frequency_at_column(int x) const;
    const std::vector<double>& bin_indices() const { return bin_index_; }

    // Linear interpolation between the two bins straddling column x
    float sample(const NormalizedRow& row, int x) const;

    void map_row(const NormalizedRow& row,
                 const VisualAdjust& adjust,
                 const ColorScheme& scheme,
                 PixelRow& out) const;

private:
    void rebuild();

    FrequencyScaleMode mode_ = FrequencyScaleMode::Linear;
    int width_ = 0;
    double sample_rate_ = 0.0;
    int bin_count_ = 0;
    FrequencyRange range_{};
    std::vector<double> frequency_hz_;
    std::vector<double> bin_index_;
};

} // namespace waterfall
