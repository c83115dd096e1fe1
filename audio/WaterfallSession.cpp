#include "WaterfallSession.hpp"

#include <iostream>
#include <utility>

namespace waterfall::audio {

AudioConfig WaterfallSession::audio_config_for(const Settings& settings) {
    AudioConfig cfg;
    cfg.device_name = settings.device_id.empty() ? std::string("default") : settings.device_id;
    return cfg;
}

WaterfallSession::WaterfallSession(const Settings& settings, AudioInputFactory factory)
    : settings_(settings),
      pipeline_(source_),
      engine_(audio_config_for(settings), std::move(factory)) {
    source_.configure(static_cast<double>(engine_.get_config().sample_rate), settings_.fft_size);
    source_.set_input_gain(settings_.sensitivity);
    engine_.set_process_callback([this](const float* input, int num_samples) {
        source_.push_samples(input, num_samples);
    });
}

WaterfallSession::~WaterfallSession() {
    stop();
}

AcquisitionError WaterfallSession::start(const std::string& device_id) {
    if (running_) return AcquisitionError::None;

    const std::string device = device_id.empty() ? std::string("default") : device_id;
    if (device != engine_.get_config().device_name) {
        engine_.change_device(device);
    }
    if (!engine_.start()) {
        const AcquisitionError err = engine_.last_error();
        std::cerr << "Waterfall start failed: " << acquisition_error_name(err) << std::endl;
        return err;
    }

    settings_.device_id = engine_.get_config().device_name;
    source_.configure(static_cast<double>(engine_.get_config().sample_rate), settings_.fft_size);
    pipeline_.start(now());
    running_ = true;
    return AcquisitionError::None;
}

void WaterfallSession::stop() {
    if (!running_) return;
    pipeline_.stop();
    engine_.stop();
    running_ = false;
    std::cout << "Waterfall stopped after " << pipeline_.rows_produced() << " rows" << std::endl;
}

void WaterfallSession::drain_queue() {
    const std::size_t dropped_before = pipeline_.dropped();
    const std::size_t delivered = pipeline_.drain([this](PixelRow&& row) {
        buffer_.insert_row(row);
    });
    if (delivered > 0) {
        std::cout << "Restored " << delivered << " queued rows";
        if (dropped_before > 0) std::cout << " (" << dropped_before << " dropped while hidden)";
        std::cout << std::endl;
    }
}

void WaterfallSession::set_visible(bool visible) {
    if (visible == pipeline_.visible()) return;
    if (!visible) {
        pipeline_.set_visible(false, now());
        return;
    }
    if (running_ && !engine_.is_running()) {
        engine_.resume();
    }
    drain_queue();
    pipeline_.set_visible(true, now());
}

bool WaterfallSession::frame(int width, int height) {
    if (width != buffer_.width() || height != buffer_.height()) {
        buffer_.resize(width, height);
        pipeline_.discard_queue();
    }
    if (!running_) return false;

    auto row = pipeline_.tick(now(), settings_, width);
    if (!row) return false;
    return buffer_.insert_row(*row);
}

void WaterfallSession::apply_settings(const Settings& settings) {
    const bool fft_changed = settings.fft_size != settings_.fft_size;
    const bool device_changed = settings.device_id != settings_.device_id;
    settings_ = settings;

    source_.set_input_gain(settings_.sensitivity);
    if (fft_changed) {
        source_.configure(static_cast<double>(engine_.get_config().sample_rate), settings_.fft_size);
    }
    if (device_changed && !settings_.device_id.empty()) {
        engine_.change_device(settings_.device_id);
        if (running_ && !engine_.is_running()) {
            std::cerr << "Capture did not restart on " << settings_.device_id << ": "
                      << acquisition_error_name(engine_.last_error()) << std::endl;
            pipeline_.stop();
            running_ = false;
        } else if (running_) {
            source_.configure(static_cast<double>(engine_.get_config().sample_rate), settings_.fft_size);
        }
    }
}

} // namespace waterfall::audio
