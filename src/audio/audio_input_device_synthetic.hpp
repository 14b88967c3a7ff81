#pragma once

#include "audio_input_device.hpp"
#include <vector>
#include <thread>
#include <atomic>

namespace audio {

/**
 * @brief Synthetic microphone producing a test tone at a native device rate
 *
 * Features:
 * - Delivers fixed-size blocks at the configured native rate (48 kHz default)
 * - Paced against the steady clock to simulate a real capture callback
 * - Tone phase is continuous across blocks
 * - Useful for testing and demos without audio hardware
 */
class AudioInputDevice_Synthetic : public IAudioInputDevice {
public:
    AudioInputDevice_Synthetic();
    ~AudioInputDevice_Synthetic() override;

    bool initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) override;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    AudioDeviceInfo get_device_info() const override;
    AudioInputConfig get_actual_config() const override { return config_; }

    /// Fill one block of tone. Exposed for tests.
    void generate_block(int16_t* out, size_t n);

private:
    void capture_thread_func();

    AudioInputConfig config_;
    AudioCallback audio_callback_;
    ErrorCallback error_callback_;
    bool initialized_ = false;

    std::vector<int16_t> block_;
    double phase_ = 0.0;

    // Threading
    std::unique_ptr<std::thread> capture_thread_;
    std::atomic<bool> is_capturing_{false};
    std::atomic<bool> should_stop_{false};
};

} // namespace audio
