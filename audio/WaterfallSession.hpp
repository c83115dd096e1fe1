#pragma once

#include <string>

#include "AudioEngine.hpp"
#include "analyser_source.hpp"
#include "app_settings.hpp"
#include "pipeline.hpp"
#include "scroll_buffer.hpp"

namespace waterfall::audio {

// Capture -> analyser -> pipeline -> scroll buffer. Everything except the
// capture callback runs on the host's driving-loop thread.
class WaterfallSession {
public:
    WaterfallSession(const Settings& settings, AudioInputFactory factory);
    ~WaterfallSession();

    // Opens the capture device (switching to device_id first if it differs).
    // On failure nothing is running and start() may be called again.
    AcquisitionError start(const std::string& device_id);
    AcquisitionError start() { return start(settings_.device_id); }
    void stop();
    bool running() const { return running_; }
    AcquisitionError last_error() const { return engine_.last_error(); }

    // Hidden -> visible drains queued rows into the buffer and restarts a
    // capture stream that stopped in the meantime
    void set_visible(bool visible);
    bool visible() const { return pipeline_.visible(); }

    // One driving-loop opportunity at the given surface size.
    // Returns true when the scroll buffer contents changed.
    bool frame(int width, int height);

    void apply_settings(const Settings& settings);
    const Settings& settings() const { return settings_; }

    // Capture-domain clock in seconds
    double now() const { return source_.capture_time(); }
    AxisContext axis_context() const { return pipeline_.axis_context(settings_, now()); }
    double hidden_interval_s() const { return WaterfallPipeline::hidden_interval_s(settings_.rows_per_second); }

    const ScrollBuffer& buffer() const { return buffer_; }
    const WaterfallPipeline& pipeline() const { return pipeline_; }
    const AudioEngine& engine() const { return engine_; }

private:
    static AudioConfig audio_config_for(const Settings& settings);
    void drain_queue();

    Settings settings_;
    dsp::AnalyserSource source_;
    WaterfallPipeline pipeline_;
    ScrollBuffer buffer_;
    // Declared after source_ so the capture thread stops before the analyser goes away
    AudioEngine engine_;
    bool running_ = false;
};

} // namespace waterfall::audio
