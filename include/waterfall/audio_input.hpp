#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace waterfall {

struct AudioConfig {
    std::string device_name = "default";
    unsigned int sample_rate = 48000;
    unsigned int period_size = 256;
    unsigned int num_periods = 4;
    bool use_realtime_priority = false;
};

// Why capture could not be acquired. None of these is fatal: the caller
// reports the problem and may retry start() without rebuilding anything else.
enum class AcquisitionError {
    None,
    AcquisitionDenied,  // permission refused
    DeviceUnavailable,  // missing or disconnected device
    DeviceBusy,         // held by another consumer
    Failed,             // anything else
};

// Maps a negative errno-style code (as returned by ALSA) to a category
AcquisitionError classify_acquisition_error(int err);
const char* acquisition_error_name(AcquisitionError e);
// One-line hint telling the user how to retry
const char* describe_acquisition_error(AcquisitionError e);

class IAudioInput {
public:
    using ProcessCallback = std::function<void(const float* input, int num_samples)>;

    virtual ~IAudioInput() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;
    // True when the stream is open but paused by the system (e.g. suspend)
    virtual bool is_suspended() const = 0;
    // Brings a suspended or unexpectedly stopped stream back
    virtual bool resume() = 0;
    virtual AcquisitionError last_error() const = 0;

    virtual void set_process_callback(ProcessCallback callback) = 0;
    virtual const AudioConfig& get_config() const = 0;

    struct LatencyStats {
        float min_ms;
        float max_ms;
        float avg_ms;
        int xruns;
    };
    virtual LatencyStats get_latency_stats() const = 0;
};

using AudioInputFactory = std::function<std::unique_ptr<IAudioInput>(const AudioConfig&)>;

// Factory that returns the active platform backend
std::unique_ptr<IAudioInput> createAudioInput(const AudioConfig& config);

} // namespace waterfall
