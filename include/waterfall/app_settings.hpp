#pragma once

#include <string>

namespace waterfall {

enum class FrequencyScaleMode {
    Linear,
    Mel,
};

// Valid ranges enforced by the setters below
namespace limits {
constexpr int min_rows_per_second = 1;
constexpr int max_rows_per_second = 2000;
constexpr float min_dynamic_range_db = 10.0f;
constexpr float max_dynamic_range_db = 140.0f;
constexpr float min_sensitivity = 0.01f;
constexpr float max_sensitivity = 10.0f;
constexpr float min_contrast = 0.1f;
constexpr float max_contrast = 3.0f;
constexpr float min_luminosity = -0.5f;
constexpr float max_luminosity = 0.5f;
constexpr int min_fft_size = 32;
constexpr int max_fft_size = 1048576;
// Largest transform the analyser path computes
constexpr int analyser_fft_ceiling = 32768;
} // namespace limits

struct Settings {
    std::string device_id = "default";
    int fft_size = 2048;            // power of two, bins = fft_size / 2
    int rows_per_second = 20;
    float dynamic_range_db = 80.0f;
    float contrast = 1.0f;
    float luminosity = 0.0f;
    float sensitivity = 1.0f;       // input gain, applied before analysis
    FrequencyScaleMode frequency_scale = FrequencyScaleMode::Linear;
    int color_scheme_idx = 0;

    int bin_count() const { return fft_size / 2; }

    void set_rows_per_second(int rows);
    void set_dynamic_range_db(float db);
    void set_sensitivity(float gain);
    void set_contrast(float c);
    void set_luminosity(float l);
    // Rounds to the nearest power of two, then caps at the analyser ceiling
    void set_fft_size(int n);
    void set_color_scheme_idx(int idx, int scheme_count);
};

// Nearest power of two to n in log2 terms, within [limits::min_fft_size, limits::max_fft_size]
int nearest_power_of_two(int n);

const char* frequency_scale_name(FrequencyScaleMode mode);

} // namespace waterfall
