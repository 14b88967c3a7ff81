#pragma once

#include "audio_input_device.hpp"
#include "file_capture.hpp"
#include <vector>
#include <thread>
#include <atomic>

namespace audio {

/**
 * @brief Microphone simulated from a WAV file
 *
 * - Uses FileCapture (dr_wav) to decode the file once
 * - Delivers blocks at the file's native rate, paced in real time
 * - Loops if configured, otherwise stops at end of file
 */
class AudioInputDevice_File : public IAudioInputDevice {
public:
    AudioInputDevice_File();
    ~AudioInputDevice_File() override;

    bool initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) override;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    AudioDeviceInfo get_device_info() const override;
    AudioInputConfig get_actual_config() const override { return actual_config_; }

private:
    void capture_thread_func();

    AudioInputConfig config_;
    AudioInputConfig actual_config_;
    AudioCallback audio_callback_;
    ErrorCallback error_callback_;

    FileCapture file_capture_;
    std::vector<int16_t> block_;
    bool initialized_ = false;

    // Threading
    std::unique_ptr<std::thread> capture_thread_;
    std::atomic<bool> is_capturing_{false};
    std::atomic<bool> should_stop_{false};
};

} // namespace audio
