#include "audio_output_device_null.hpp"
#include <chrono>
#include <thread>

namespace audio {

AudioOutputDevice_Null::AudioOutputDevice_Null(int block_ms)
    : block_ms_(block_ms > 0 ? block_ms : 10) {}

AudioOutputDevice_Null::~AudioOutputDevice_Null() {
    stop();
}

bool AudioOutputDevice_Null::start(int sample_rate, RenderCallback render) {
    if (is_running_.load()) {
        return true;  // Already running
    }
    if (sample_rate <= 0 || !render) {
        return false;
    }
    if (!open_sink(sample_rate)) {
        return false;
    }

    sample_rate_ = sample_rate;
    render_ = std::move(render);
    block_.assign(static_cast<size_t>(sample_rate_) * block_ms_ / 1000, 0);

    should_stop_.store(false);
    is_running_.store(true);
    render_thread_ = std::make_unique<std::thread>(
        &AudioOutputDevice_Null::render_thread_func, this
    );
    return true;
}

void AudioOutputDevice_Null::stop() {
    if (!is_running_.load()) {
        return;
    }

    should_stop_.store(true);
    if (render_thread_ && render_thread_->joinable()) {
        render_thread_->join();
    }
    render_thread_.reset();
    is_running_.store(false);
    close_sink();
}

void AudioOutputDevice_Null::on_block(const int16_t*, size_t) {}

bool AudioOutputDevice_Null::open_sink(int) { return true; }

void AudioOutputDevice_Null::close_sink() {}

void AudioOutputDevice_Null::render_thread_func() {
    auto next_block_time = std::chrono::steady_clock::now();
    const auto block_duration = std::chrono::milliseconds(block_ms_);

    while (!should_stop_.load()) {
        render_(block_.data(), block_.size());
        on_block(block_.data(), block_.size());

        // Pace against absolute deadlines so the clock tracks wall time
        next_block_time += block_duration;
        std::this_thread::sleep_until(next_block_time);
    }
}

} // namespace audio
