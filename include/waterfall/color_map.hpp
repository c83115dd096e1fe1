#pragma once

#include <vector>
#include "frame_types.hpp"

namespace waterfall {

struct ColorStop { float position; float r, g, b; };
struct ColorScheme { const char* name; std::vector<ColorStop> stops; };

// Built-in gradients, index 0 is the default
const std::vector<ColorScheme>& color_schemes();

// Colour for t in [0,1] (clamped) by piecewise-linear interpolation of stops
Rgb color_from_scheme(const ColorScheme& scheme, float t01);

} // namespace waterfall
