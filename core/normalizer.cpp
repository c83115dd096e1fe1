#include "normalizer.hpp"

#include <algorithm>
#include <cmath>

namespace waterfall {

static inline float clamp01(float v) { return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v); }

float Normalizer::level_to_db(std::uint8_t level, float min_db, float max_db) {
    return min_db + (static_cast<float>(level) / 255.0f) * (max_db - min_db);
}

float Normalizer::normalize_db(float db, float max_db, float dynamic_range_db) {
    // NaN (e.g. log of a zero bin upstream) reads as silence
    if (std::isnan(db) || !(dynamic_range_db > 0.0f)) return 0.0f;
    const float floor_db = max_db - dynamic_range_db;
    return clamp01((db - floor_db) / dynamic_range_db);
}

NormalizedRow Normalizer::normalize(const RawFrame& frame, float dynamic_range_db) {
    NormalizedRow out;
    normalize(frame, dynamic_range_db, out);
    return out;
}

void Normalizer::normalize(const RawFrame& frame, float dynamic_range_db, NormalizedRow& out) {
    const int bins = frame.bin_count();
    out.resize(static_cast<size_t>(bins));
    if (frame.encoding == MagnitudeEncoding::Level) {
        for (int i = 0; i < bins; ++i) {
            const float db = level_to_db(frame.levels[i], frame.min_db, frame.max_db);
            out[i] = normalize_db(db, frame.max_db, dynamic_range_db);
        }
    } else {
        for (int i = 0; i < bins; ++i) {
            out[i] = normalize_db(frame.decibels[i], frame.max_db, dynamic_range_db);
        }
    }
}

} // namespace waterfall
