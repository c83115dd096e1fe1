#include "AudioEngine.hpp"

#include <iostream>
#include <utility>

namespace waterfall::audio {

AudioEngine::AudioEngine(const AudioConfig& initial_config, AudioInputFactory factory)
    : config_(initial_config), factory_(std::move(factory)) {
    recreate_backend();
}

void AudioEngine::recreate_backend() {
    backend_ = factory_ ? factory_(config_) : nullptr;
    if (backend_ && callback_) backend_->set_process_callback(callback_);
}

bool AudioEngine::start() {
    if (!backend_) recreate_backend();
    if (!backend_) {
        last_error_ = AcquisitionError::Failed;
        return false;
    }
    const bool ok = backend_->start();
    last_error_ = ok ? AcquisitionError::None : backend_->last_error();
    if (ok) {
        std::cout << "Capture started on " << backend_->get_config().device_name
                  << " at " << backend_->get_config().sample_rate << " Hz" << std::endl;
    }
    return ok;
}

void AudioEngine::stop() {
    if (backend_) backend_->stop();
}

bool AudioEngine::is_running() const {
    return backend_ && backend_->is_running();
}

bool AudioEngine::resume() {
    if (!backend_) return false;
    if (backend_->is_running()) return true;
    const bool ok = backend_->resume();
    last_error_ = ok ? AcquisitionError::None : backend_->last_error();
    if (!ok) {
        std::cerr << "Capture resume failed: " << acquisition_error_name(last_error_) << std::endl;
    }
    return ok;
}

AcquisitionError AudioEngine::last_error() const {
    return last_error_;
}

void AudioEngine::set_process_callback(ProcessCallback cb) {
    callback_ = cb;
    if (backend_) backend_->set_process_callback(callback_);
}

const AudioConfig& AudioEngine::get_config() const {
    return backend_ ? backend_->get_config() : config_;
}

void AudioEngine::change_device(const std::string& device_name) {
    bool was_running = is_running();
    if (backend_) backend_->stop();
    config_.device_name = device_name;
    recreate_backend();
    if (was_running) start();
}

IAudioInput::LatencyStats AudioEngine::get_latency_stats() const {
    return backend_ ? backend_->get_latency_stats() : IAudioInput::LatencyStats{};
}

} // namespace waterfall::audio
