#include "audio_input_device_file.hpp"
#include <string>
#include <chrono>
#include <thread>

namespace audio {

AudioInputDevice_File::AudioInputDevice_File() = default;

AudioInputDevice_File::~AudioInputDevice_File() {
    stop();
}

bool AudioInputDevice_File::initialize(
    const AudioInputConfig& config,
    AudioCallback audio_callback,
    ErrorCallback error_callback
) {
    config_ = config;
    audio_callback_ = audio_callback;
    error_callback_ = error_callback;

    std::string path = config.file_path;
    if (path.empty() && config.device_id.rfind("file:", 0) == 0) {
        path = config.device_id.substr(5);
    }
    if (path.empty()) {
        if (error_callback_) {
            error_callback_("File device requires a WAV path", true);
        }
        return false;
    }

    if (!file_capture_.start_from_wav(path)) {
        if (error_callback_) {
            error_callback_("Failed to load WAV file: " + path, true);
        }
        return false;
    }

    // The file decides the native rate
    actual_config_ = config_;
    actual_config_.file_path = path;
    actual_config_.sample_rate = file_capture_.sample_rate();
    actual_config_.channels = 1;
    block_.assign(static_cast<size_t>(config_.frame_samples > 0 ? config_.frame_samples : 4096), 0);
    initialized_ = true;
    return true;
}

bool AudioInputDevice_File::start() {
    if (!initialized_) {
        return false;
    }
    if (is_capturing_.load()) {
        return true;  // Already capturing
    }

    should_stop_.store(false);
    is_capturing_.store(true);

    capture_thread_ = std::make_unique<std::thread>(
        &AudioInputDevice_File::capture_thread_func, this
    );

    return true;
}

void AudioInputDevice_File::stop() {
    should_stop_.store(true);

    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }

    capture_thread_.reset();
    is_capturing_.store(false);
}

void AudioInputDevice_File::capture_thread_func() {
    auto next_callback_time = std::chrono::steady_clock::now();
    const int sample_rate = file_capture_.sample_rate();

    while (!should_stop_.load()) {
        size_t n = file_capture_.read_chunk(block_.data(), block_.size());

        if (n == 0) {
            if (actual_config_.file_loop) {
                file_capture_.rewind();
                continue;
            }
            // End of file, stop capturing
            break;
        }

        if (audio_callback_) {
            audio_callback_(block_.data(), n, sample_rate, 1);
        }

        // Sleep based on actual chunk duration (simulate real-time capture)
        auto chunk_duration = std::chrono::duration<double>(static_cast<double>(n) / sample_rate);
        next_callback_time += std::chrono::duration_cast<std::chrono::steady_clock::duration>(chunk_duration);
        std::this_thread::sleep_until(next_callback_time);
    }

    is_capturing_.store(false);
}

AudioDeviceInfo AudioInputDevice_File::get_device_info() const {
    AudioDeviceInfo info;
    info.id = "file:" + actual_config_.file_path;
    info.name = "File Device (" + file_capture_.source_path() + ", " +
                std::to_string(file_capture_.channels()) + " ch, " +
                std::to_string(static_cast<int>(file_capture_.duration_seconds())) + " s)";
    info.driver = "File";
    info.default_sample_rate = file_capture_.sample_rate();
    info.max_channels = 1;
    info.is_default = false;
    return info;
}

} // namespace audio
