#include "axis_ticks.hpp"
#include "frequency_mapper.hpp"
#include "test_check.hpp"

using namespace waterfall;

static AxisContext context(double sample_rate, double rps) {
    AxisContext ctx;
    ctx.sample_rate = sample_rate;
    ctx.bin_count = 1024;
    ctx.rows_per_second = rps;
    return ctx;
}

int main() {
    // Step selection
    {
        CHECK_NEAR(select_frequency_step(1200, 16000.0), 2000.0, 1e-9);
        CHECK_NEAR(select_frequency_step(600, 16000.0), 5000.0, 1e-9);
        CHECK_NEAR(select_frequency_step(100, 4000.0), 1000.0, 1e-9);
        CHECK_NEAR(select_frequency_step(1200, 1e9), 10000.0, 1e-9);
        CHECK_NEAR(select_time_step(400, 20.0), 5.0, 1e-9);
        CHECK_NEAR(select_time_step(800, 100.0), 1.0, 1e-9);
        CHECK_NEAR(select_time_step(100000, 0.001), 3600.0, 1e-9);
    }

    // Labels
    {
        CHECK(format_frequency_label(440.0) == "440 Hz");
        CHECK(format_frequency_label(2000.0) == "2 kHz");
        CHECK(format_frequency_label(1500.0) == "1.5 kHz");
        CHECK(format_time_label(0.5, 0.5) == "0.5 s");
        CHECK(format_time_label(5.0, 5.0) == "5 s");
        CHECK(format_time_label(120.0, 60.0) == "2 min");
        CHECK(format_time_label(90.0, 30.0) == "1.5 min");
    }

    // Linear ticks sit over the columns showing their frequency
    {
        const auto ctx = context(48000.0, 20.0);
        double step = 0.0;
        const auto ticks = frequency_ticks(FrequencyScaleMode::Linear, ctx, 1200, &step);
        CHECK_NEAR(step, 2000.0, 1e-9);
        CHECK(ticks.size() == 8);
        CHECK(ticks.front().label == "2 kHz");
        CHECK(ticks.back().label == "16 kHz");

        FrequencyMapper m;
        m.configure(FrequencyScaleMode::Linear, 1200, 48000.0, 1024);
        for (const auto& t : ticks) {
            const int x = static_cast<int>(t.position + 0.5f);
            CHECK(x >= 0 && x < 1200);
            CHECK_NEAR(m.frequency_at_column(x), t.value, 16000.0 / 1199.0);
        }
    }

    // Mel ticks come from the fixed set, strictly inside the displayed range
    {
        const auto ctx = context(48000.0, 20.0);
        double step = -1.0;
        const auto ticks = frequency_ticks(FrequencyScaleMode::Mel, ctx, 800, &step);
        CHECK_NEAR(step, 0.0, 1e-12);
        CHECK(ticks.size() == 16);
        CHECK_NEAR(ticks.front().value, 20.0, 1e-9);
        CHECK_NEAR(ticks.back().value, 16000.0, 1e-9);
        bool increasing = true;
        for (size_t i = 1; i < ticks.size(); ++i) {
            if (ticks[i].position <= ticks[i - 1].position) increasing = false;
        }
        CHECK(increasing);

        const auto low = frequency_ticks(FrequencyScaleMode::Mel, context(8000.0, 20.0), 800);
        CHECK(!low.empty());
        CHECK(low.back().value <= 4000.0);
    }

    // Time ticks: newest at the top, one row per 1/R seconds
    {
        const auto ctx = context(48000.0, 20.0);
        double step = 0.0;
        const auto ticks = time_ticks(ctx, 400, &step);
        CHECK_NEAR(step, 5.0, 1e-9);
        CHECK(ticks.size() == 5);
        CHECK_NEAR(ticks[0].position, 0.0, 1e-6);
        CHECK_NEAR(ticks[1].position, 100.0, 1e-4);
        CHECK(ticks[1].label == "5 s");
        CHECK_NEAR(ticks[4].position, 400.0, 1e-3);
    }

    // Same inputs, same layout
    {
        const auto ctx = context(44100.0, 37.0);
        const auto a = layout_axes(FrequencyScaleMode::Linear, ctx, 913, 457);
        const auto b = layout_axes(FrequencyScaleMode::Linear, ctx, 913, 457);
        CHECK(a.frequency.size() == b.frequency.size());
        CHECK(a.time.size() == b.time.size());
        for (size_t i = 0; i < a.frequency.size() && i < b.frequency.size(); ++i) {
            CHECK(a.frequency[i].position == b.frequency[i].position);
            CHECK(a.frequency[i].label == b.frequency[i].label);
        }
    }

    // Degenerate inputs produce no ticks
    {
        CHECK(layout_axes(FrequencyScaleMode::Linear, context(48000.0, 20.0), 0, 300).frequency.empty());
        CHECK(layout_axes(FrequencyScaleMode::Linear, context(48000.0, 20.0), 300, 0).time.empty());
        CHECK(frequency_ticks(FrequencyScaleMode::Linear, context(0.0, 20.0), 300).empty());
        CHECK(frequency_ticks(FrequencyScaleMode::Mel, context(48000.0, 20.0), 1).empty());
        CHECK(time_ticks(context(48000.0, 0.0), 300).empty());
    }

    return finish("axis_ticks_test");
}
