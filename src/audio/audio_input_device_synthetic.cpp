#include "audio_input_device_synthetic.hpp"
#include <chrono>
#include <thread>
#include <algorithm>
#include <cmath>

namespace audio {

namespace {
constexpr double kTwoPi = 6.283185307179586;
}

AudioInputDevice_Synthetic::AudioInputDevice_Synthetic() = default;

AudioInputDevice_Synthetic::~AudioInputDevice_Synthetic() {
    stop();
}

bool AudioInputDevice_Synthetic::initialize(
    const AudioInputConfig& config,
    AudioCallback audio_callback,
    ErrorCallback error_callback
) {
    config_ = config;
    audio_callback_ = audio_callback;
    error_callback_ = error_callback;

    if (config_.sample_rate <= 0 || config_.frame_samples <= 0) {
        if (error_callback_) {
            error_callback_("Synthetic device requires positive sample_rate and frame_samples", true);
        }
        return false;
    }

    config_.channels = 1;
    block_.assign(static_cast<size_t>(config_.frame_samples), 0);
    phase_ = 0.0;
    initialized_ = true;
    return true;
}

bool AudioInputDevice_Synthetic::start() {
    if (!initialized_) {
        return false;
    }
    if (is_capturing_.load()) {
        return true;  // Already capturing
    }

    should_stop_.store(false);
    is_capturing_.store(true);

    capture_thread_ = std::make_unique<std::thread>(
        &AudioInputDevice_Synthetic::capture_thread_func, this
    );

    return true;
}

void AudioInputDevice_Synthetic::stop() {
    should_stop_.store(true);

    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }

    capture_thread_.reset();
    is_capturing_.store(false);
}

void AudioInputDevice_Synthetic::generate_block(int16_t* out, size_t n) {
    const double step = kTwoPi * config_.tone_hz / static_cast<double>(config_.sample_rate);
    const double amp = std::clamp(config_.tone_level, 0.0, 1.0) * 32767.0;
    for (size_t i = 0; i < n; ++i) {
        out[i] = static_cast<int16_t>(std::lrint(amp * std::sin(phase_)));
        phase_ += step;
        if (phase_ >= kTwoPi) phase_ -= kTwoPi;
    }
}

void AudioInputDevice_Synthetic::capture_thread_func() {
    auto next_callback_time = std::chrono::steady_clock::now();
    const double block_s = static_cast<double>(block_.size()) / config_.sample_rate;
    const auto block_duration = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(block_s));

    while (!should_stop_.load()) {
        generate_block(block_.data(), block_.size());

        if (audio_callback_) {
            audio_callback_(block_.data(), block_.size(), config_.sample_rate, 1);
        }

        // Sleep for the block duration (simulate a real capture period)
        next_callback_time += block_duration;
        std::this_thread::sleep_until(next_callback_time);
    }
}

AudioDeviceInfo AudioInputDevice_Synthetic::get_device_info() const {
    AudioDeviceInfo info;
    info.id = "synthetic";
    info.name = "Synthetic Device (Test Tone)";
    info.driver = "Synthetic";
    info.default_sample_rate = config_.sample_rate;
    info.max_channels = 1;
    info.is_default = true;
    return info;
}

} // namespace audio
