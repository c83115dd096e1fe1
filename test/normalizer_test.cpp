#include "normalizer.hpp"
#include "test_check.hpp"

#include <cmath>
#include <initializer_list>
#include <limits>

using namespace waterfall;

static RawFrame level_frame(std::initializer_list<std::uint8_t> levels) {
    RawFrame f;
    f.encoding = MagnitudeEncoding::Level;
    f.levels.assign(levels.begin(), levels.end());
    f.min_db = -100.0f;
    f.max_db = -20.0f;
    return f;
}

int main() {
    // Full byte range over an 80 dB window covers [0,1] exactly
    {
        const auto row = Normalizer::normalize(level_frame({0, 51, 255}), 80.0f);
        CHECK(row.size() == 3);
        CHECK_NEAR(row[0], 0.0, 1e-6);
        CHECK_NEAR(row[1], 0.2, 1e-5);
        CHECK_NEAR(row[2], 1.0, 1e-6);
    }

    // Narrower range keeps the top fixed and drops the quiet tail
    {
        const auto row = Normalizer::normalize(level_frame({0, 128, 255}), 40.0f);
        CHECK_NEAR(row[0], 0.0, 1e-6);
        CHECK_NEAR(row[2], 1.0, 1e-6);
        const float db = Normalizer::level_to_db(128, -100.0f, -20.0f);
        CHECK_NEAR(row[1], (db - (-60.0f)) / 40.0f, 1e-5);
    }

    // Decibel frames clamp far-out values and treat NaN as silence
    {
        RawFrame f;
        f.encoding = MagnitudeEncoding::Decibels;
        f.max_db = -20.0f;
        f.decibels = {-200.0f, 50.0f, -60.0f, std::numeric_limits<float>::quiet_NaN(),
                      -std::numeric_limits<float>::infinity()};
        const auto row = Normalizer::normalize(f, 80.0f);
        CHECK(row.size() == 5);
        CHECK_NEAR(row[0], 0.0, 1e-6);
        CHECK_NEAR(row[1], 1.0, 1e-6);
        CHECK_NEAR(row[2], 0.5, 1e-6);
        CHECK_NEAR(row[3], 0.0, 1e-6);
        CHECK_NEAR(row[4], 0.0, 1e-6);
    }

    // Output buffer is reused and resized to the frame
    {
        NormalizedRow out(10, 0.5f);
        Normalizer::normalize(level_frame({255}), 80.0f, out);
        CHECK(out.size() == 1);
        CHECK_NEAR(out[0], 1.0, 1e-6);
    }

    CHECK_NEAR(Normalizer::normalize_db(-20.0f, -20.0f, 0.0f), 0.0, 1e-6);

    return finish("normalizer_test");
}
