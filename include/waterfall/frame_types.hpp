#pragma once

#include <cstdint>
#include <vector>

namespace waterfall {

// How the magnitudes in a RawFrame are expressed
enum class MagnitudeEncoding {
    Level,     // 0..255 byte spread across [min_db, max_db]
    Decibels,  // direct dB values
};

// One snapshot from the magnitude source. Bins run from 0 Hz to Nyquist.
struct RawFrame {
    MagnitudeEncoding encoding = MagnitudeEncoding::Level;
    std::vector<std::uint8_t> levels;  // used when encoding == Level
    std::vector<float> decibels;       // used when encoding == Decibels
    float min_db = -100.0f;
    float max_db = -20.0f;
    double sample_rate = 48000.0;
    double capture_time = 0.0;         // seconds, capture-domain clock

    int bin_count() const {
        return static_cast<int>(encoding == MagnitudeEncoding::Level ? levels.size() : decibels.size());
    }
};

// Per-bin intensity, every value in [0,1]
using NormalizedRow = std::vector<float>;

struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

// One screen row, one colour per pixel column
using PixelRow = std::vector<Rgb>;

// Read-only snapshot used to lay out the axes
struct AxisContext {
    double sample_rate = 48000.0;
    int bin_count = 1024;
    double rows_per_second = 20.0;
    double session_start = 0.0;
    double current_time = 0.0;

    double elapsed() const { return current_time > session_start ? current_time - session_start : 0.0; }
};

} // namespace waterfall
