#pragma once

#include "audio_input.hpp"
#include <memory>
#include <string>

namespace waterfall::audio {

// Thin wrapper that owns the platform audio backend and provides
// a stable API for the session and GUI layers.
class AudioEngine {
public:
    using ProcessCallback = IAudioInput::ProcessCallback;

    AudioEngine(const AudioConfig& initial_config, AudioInputFactory factory);

    // On failure the backend stays in place so start() can simply be retried
    bool start();
    void stop();
    bool is_running() const;
    // Restarts capture that was suspended or died while the owner was not looking
    bool resume();
    AcquisitionError last_error() const;

    void set_process_callback(ProcessCallback cb);
    // Actual configuration once started (rate and period may be adjusted)
    const AudioConfig& get_config() const;
    void change_device(const std::string& device_name);

    IAudioInput::LatencyStats get_latency_stats() const;

private:
    void recreate_backend();

    AudioConfig config_{};
    AudioInputFactory factory_;
    std::unique_ptr<IAudioInput> backend_;
    ProcessCallback callback_{};
    AcquisitionError last_error_ = AcquisitionError::None;
};

} // namespace waterfall::audio
