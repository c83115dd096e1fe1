#pragma once

#include <cstdint>
#include "frame_types.hpp"

namespace waterfall {

// Maps raw magnitudes into [0,1] through a dynamic-range window of width
// dynamic_range_db whose top edge sits at max_db. The loudest content always
// lands at 1.0; narrowing the window only drops the quiet tail.
class Normalizer {
public:
    // Byte level in [0,255] spread linearly across [min_db, max_db]
    static float level_to_db(std::uint8_t level, float min_db, float max_db);

    // Single decibel value to [0,1]
    static float normalize_db(float db, float max_db, float dynamic_range_db);

    // Whole frame; output has frame.bin_count() entries.
    // dynamic_range_db is expected to be pre-clamped by Settings.
    static NormalizedRow normalize(const RawFrame& frame, float dynamic_range_db);
    static void normalize(const RawFrame& frame, float dynamic_range_db, NormalizedRow& out);
};

} // namespace waterfall
