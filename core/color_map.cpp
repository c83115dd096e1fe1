#include "color_map.hpp"

#include <cstddef>
#include <cstdint>

namespace waterfall {

static inline float clamp01(float v) { return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v); }

static inline Rgb to_rgb(float r, float g, float b) {
    return Rgb{static_cast<std::uint8_t>(clamp01(r) * 255.0f),
               static_cast<std::uint8_t>(clamp01(g) * 255.0f),
               static_cast<std::uint8_t>(clamp01(b) * 255.0f)};
}

const std::vector<ColorScheme>& color_schemes() {
    static const std::vector<ColorScheme> schemes = {
        {"Viridis", {{0.00f,0.267f,0.005f,0.329f},{0.25f,0.253f,0.265f,0.529f},{0.50f,0.127f,0.567f,0.551f},{0.75f,0.369f,0.787f,0.382f},{1.00f,0.993f,0.906f,0.144f}}},
        // Blue -> green -> red ramp; breakpoints are the kinks of
        // r=1.5x-0.2, g=1.5(1-2|x-0.5|), b=1.3-1.5x after clamping
        {"Classic", {{0.0f,0.0f,0.0f,1.0f},{0.1333f,0.0f,0.4f,1.0f},{0.2f,0.1f,0.6f,1.0f},{0.3333f,0.3f,1.0f,0.8f},
                     {0.6667f,0.8f,1.0f,0.3f},{0.8f,1.0f,0.6f,0.1f},{0.8667f,1.0f,0.4f,0.0f},{1.0f,1.0f,0.0f,0.0f}}},
        {"Grayscale", {{0.0f,0.0f,0.0f,0.0f},{1.0f,1.0f,1.0f,1.0f}}},
        {"Thermal", {{0.00f,0.00f,0.00f,0.00f},{0.30f,0.50f,0.00f,0.00f},{0.60f,1.00f,0.50f,0.00f},{0.80f,1.00f,0.80f,0.20f},{1.00f,1.00f,1.00f,1.00f}}},
        {"Batlow", {{0.00f,0.005f,0.089f,0.209f},{0.25f,0.107f,0.288f,0.399f},{0.50f,0.458f,0.444f,0.444f},{0.75f,0.796f,0.555f,0.322f},{1.00f,0.993f,0.747f,0.009f}}},
    };
    return schemes;
}

Rgb color_from_scheme(const ColorScheme& scheme, float t01) {
    t01 = clamp01(t01);
    if (scheme.stops.empty()) return to_rgb(t01, t01, t01);
    if (t01 <= scheme.stops.front().position) {
        const auto& s = scheme.stops.front();
        return to_rgb(s.r, s.g, s.b);
    }
    for (size_t i = 0; i + 1 < scheme.stops.size(); ++i) {
        const auto& a = scheme.stops[i];
        const auto& b = scheme.stops[i+1];
        if (t01 <= b.position) {
            float span = (b.position - a.position);
            float u = span > 0.0f ? (t01 - a.position) / span : 0.0f;
            return to_rgb(a.r + (b.r - a.r) * u,
                          a.g + (b.g - a.g) * u,
                          a.b + (b.b - a.b) * u);
        }
    }
    const auto& e = scheme.stops.back();
    return to_rgb(e.r, e.g, e.b);
}

} // namespace waterfall
