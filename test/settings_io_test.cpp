#include "app_settings.hpp"
#include "app_settings_io.hpp"
#include "color_map.hpp"
#include "test_check.hpp"

#include <cstdio>
#include <limits>
#include <string>
#include <unistd.h>

using namespace waterfall;

static std::string temp_path(const char* tag) {
    return std::string("/tmp/waterfall_") + tag + "_" + std::to_string(static_cast<long>(getpid())) + ".json";
}

int main() {
    // Setters clamp into range
    {
        Settings s;
        s.set_rows_per_second(0);
        CHECK(s.rows_per_second == limits::min_rows_per_second);
        s.set_rows_per_second(100000);
        CHECK(s.rows_per_second == limits::max_rows_per_second);
        s.set_dynamic_range_db(1.0f);
        CHECK_NEAR(s.dynamic_range_db, limits::min_dynamic_range_db, 1e-6);
        s.set_contrast(9.0f);
        CHECK_NEAR(s.contrast, 3.0, 1e-6);
        s.set_luminosity(-4.0f);
        CHECK_NEAR(s.luminosity, -0.5, 1e-6);
        s.set_sensitivity(std::numeric_limits<float>::quiet_NaN());
        CHECK_NEAR(s.sensitivity, 1.0, 1e-6);
        s.set_color_scheme_idx(99, 5);
        CHECK(s.color_scheme_idx == 4);
        s.set_color_scheme_idx(-2, 5);
        CHECK(s.color_scheme_idx == 0);
    }

    // Transform sizes snap to a power of two within the analyser limit
    {
        CHECK(nearest_power_of_two(46) == 64);
        CHECK(nearest_power_of_two(1500) == 2048);
        CHECK(nearest_power_of_two(2800) == 2048);
        CHECK(nearest_power_of_two(3000) == 4096);
        CHECK(nearest_power_of_two(3072) == 4096);
        CHECK(nearest_power_of_two(3500) == 4096);
        CHECK(nearest_power_of_two(6000) == 8192);
        CHECK(nearest_power_of_two(12000) == 16384);
        CHECK(nearest_power_of_two(0) == 32);
        CHECK(nearest_power_of_two(1 << 30) == limits::max_fft_size);
        Settings s;
        s.set_fft_size(100000);
        CHECK(s.fft_size == limits::analyser_fft_ceiling);
        s.set_fft_size(1000);
        CHECK(s.fft_size == 1024);
        CHECK(s.bin_count() == 512);
        s.set_fft_size(3000);
        CHECK(s.fft_size == 4096);
    }

    // Save then load restores every field
    {
        Settings s;
        s.device_id = "plughw:1,0";
        s.set_fft_size(8192);
        s.set_rows_per_second(45);
        s.set_dynamic_range_db(60.0f);
        s.set_contrast(1.5f);
        s.set_luminosity(-0.125f);
        s.set_sensitivity(2.5f);
        s.frequency_scale = FrequencyScaleMode::Mel;
        s.set_color_scheme_idx(2, static_cast<int>(color_schemes().size()));

        const std::string path = temp_path("roundtrip");
        CHECK(save_settings(path.c_str(), s));
        Settings r;
        CHECK(load_settings(path.c_str(), r));
        CHECK(r.device_id == "plughw:1,0");
        CHECK(r.fft_size == 8192);
        CHECK(r.rows_per_second == 45);
        CHECK_NEAR(r.dynamic_range_db, 60.0, 1e-3);
        CHECK_NEAR(r.contrast, 1.5, 1e-3);
        CHECK_NEAR(r.luminosity, -0.125, 1e-3);
        CHECK_NEAR(r.sensitivity, 2.5, 1e-3);
        CHECK(r.frequency_scale == FrequencyScaleMode::Mel);
        CHECK(r.color_scheme_idx == 2);
        std::remove(path.c_str());
    }

    // Hand-edited values are clamped, missing keys keep defaults
    {
        const std::string path = temp_path("edited");
        FILE* f = std::fopen(path.c_str(), "wb");
        CHECK(f != nullptr);
        if (f) {
            std::fputs("{\n  \"fft_size\": 3000,\n  \"rows_per_second\": 5000,\n"
                       "  \"contrast\": 9,\n  \"color_scheme\": 99,\n  \"frequency_scale\": \"linear\"\n}\n", f);
            std::fclose(f);
        }
        Settings r;
        CHECK(load_settings(path.c_str(), r));
        CHECK(r.fft_size == 4096);
        CHECK(r.rows_per_second == limits::max_rows_per_second);
        CHECK(r.color_scheme_idx == static_cast<int>(color_schemes().size()) - 1);
        CHECK_NEAR(r.contrast, 3.0, 1e-6);
        CHECK(r.device_id == "default");
        CHECK_NEAR(r.dynamic_range_db, 80.0, 1e-6);
        CHECK(r.frequency_scale == FrequencyScaleMode::Linear);
        std::remove(path.c_str());
    }

    // Rates up to the maximum survive a save and load, negative schemes load as the first
    {
        const std::string path = temp_path("fastrows");
        FILE* f = std::fopen(path.c_str(), "wb");
        CHECK(f != nullptr);
        if (f) {
            std::fputs("{\n  \"rows_per_second\": 1500,\n  \"color_scheme\": -3\n}\n", f);
            std::fclose(f);
        }
        Settings r;
        CHECK(load_settings(path.c_str(), r));
        CHECK(r.rows_per_second == 1500);
        CHECK(r.color_scheme_idx == 0);
        r.set_rows_per_second(limits::max_rows_per_second);
        CHECK(save_settings(path.c_str(), r));
        Settings back;
        CHECK(load_settings(path.c_str(), back));
        CHECK(back.rows_per_second == limits::max_rows_per_second);
        std::remove(path.c_str());
    }

    // Missing file leaves settings untouched
    {
        Settings r;
        r.rows_per_second = 33;
        CHECK(!load_settings("/nonexistent/dir/settings.json", r));
        CHECK(r.rows_per_second == 33);
        CHECK(!save_settings("/nonexistent/dir/settings.json", r));
    }

    CHECK(std::string(frequency_scale_name(FrequencyScaleMode::Mel)) == "mel");
    CHECK(std::string(frequency_scale_name(FrequencyScaleMode::Linear)) == "linear");

    return finish("settings_io_test");
}
