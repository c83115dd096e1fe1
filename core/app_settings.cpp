#include "app_settings.hpp"

#include <algorithm>
#include <cmath>

namespace waterfall {

int nearest_power_of_two(int n) {
    n = std::clamp(n, limits::min_fft_size, limits::max_fft_size);
    // Nearest in octaves, not in samples
    const int exponent = static_cast<int>(std::lround(std::log2(static_cast<double>(n))));
    return 1 << exponent;
}

void Settings::set_rows_per_second(int rows) {
    rows_per_second = std::clamp(rows, limits::min_rows_per_second, limits::max_rows_per_second);
}

void Settings::set_dynamic_range_db(float db) {
    if (!std::isfinite(db)) return;
    dynamic_range_db = std::clamp(db, limits::min_dynamic_range_db, limits::max_dynamic_range_db);
}

void Settings::set_sensitivity(float gain) {
    if (!std::isfinite(gain)) return;
    sensitivity = std::clamp(gain, limits::min_sensitivity, limits::max_sensitivity);
}

void Settings::set_contrast(float c) {
    if (!std::isfinite(c)) return;
    contrast = std::clamp(c, limits::min_contrast, limits::max_contrast);
}

void Settings::set_luminosity(float l) {
    if (!std::isfinite(l)) return;
    luminosity = std::clamp(l, limits::min_luminosity, limits::max_luminosity);
}

void Settings::set_fft_size(int n) {
    fft_size = std::min(nearest_power_of_two(n), limits::analyser_fft_ceiling);
}

void Settings::set_color_scheme_idx(int idx, int scheme_count) {
    color_scheme_idx = scheme_count > 0 ? std::clamp(idx, 0, scheme_count - 1) : 0;
}

const char* frequency_scale_name(FrequencyScaleMode mode) {
    return mode == FrequencyScaleMode::Mel ? "mel" : "linear";
}

} // namespace waterfall
