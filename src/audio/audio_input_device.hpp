#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <cstddef>
#include <cstdint>

namespace audio {

/**
 * @brief Metadata about an audio input device
 */
struct AudioDeviceInfo {
    std::string id;              // Device identifier ("synthetic", "file:<path>")
    std::string name;            // Human-readable name
    std::string driver;          // Driver/API name ("Synthetic", "File")
    int default_sample_rate;     // Native sample rate (48000, 44100, etc.)
    int max_channels;            // Maximum supported channels
    bool is_default;             // Is this the default device?

    AudioDeviceInfo()
        : default_sample_rate(48000)
        , max_channels(1)
        , is_default(false) {}
};

/**
 * @brief Configuration for audio input capture
 */
struct AudioInputConfig {
    std::string device_id;       // Device to use (empty = synthetic)
    int sample_rate = 48000;     // Requested native sample rate (devices may override)
    int channels = 1;            // Capture is mono
    int frame_samples = 4096;    // Samples per callback block

    // For synthetic device only
    double tone_hz = 440.0;      // Test tone frequency
    double tone_level = 0.2;     // Amplitude, 0..1 of full scale

    // For file device only
    std::string file_path;       // Path to WAV file
    bool file_loop = true;       // Loop playback?
};

/**
 * @brief Callback for audio data
 *
 * Called from the device's capture thread for every block. Runs on the
 * capture timing budget: must not block, must not perform I/O.
 *
 * @param samples PCM16 mono samples
 * @param sample_count Number of samples
 * @param sample_rate Native sample rate of the data
 * @param channels Number of channels (always 1 for current devices)
 */
using AudioCallback = std::function<void(
    const int16_t* samples,
    size_t sample_count,
    int sample_rate,
    int channels
)>;

/**
 * @brief Error callback for device issues
 *
 * @param error_message Human-readable error description
 * @param is_fatal If true, device has stopped and needs restart
 */
using ErrorCallback = std::function<void(const std::string& error_message, bool is_fatal)>;

/**
 * @brief Abstract base class for audio input devices
 *
 * Implementations:
 * - AudioInputDevice_Synthetic (generated test tone)
 * - AudioInputDevice_File (WAV file playback)
 */
class IAudioInputDevice {
public:
    virtual ~IAudioInputDevice() = default;

    /**
     * @brief Initialize the device with configuration
     * @param config Device configuration
     * @param audio_callback Called when audio data is ready
     * @param error_callback Called on errors
     * @return true if initialization succeeded
     */
    virtual bool initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) = 0;

    /**
     * @brief Start capturing audio
     * @return true if started successfully
     */
    virtual bool start() = 0;

    /**
     * @brief Stop capturing audio. Synchronous: no callback runs after return.
     */
    virtual void stop() = 0;

    /**
     * @brief Check if device is currently capturing
     */
    virtual bool is_capturing() const = 0;

    /**
     * @brief Get device information
     */
    virtual AudioDeviceInfo get_device_info() const = 0;

    /**
     * @brief Get actual configuration being used (may differ from requested)
     */
    virtual AudioInputConfig get_actual_config() const = 0;
};

/**
 * @brief Factory for creating audio input devices
 */
class AudioInputFactory {
public:
    /**
     * @brief Create an audio input device
     * @param device_id Special values:
     *                  - "" or "synthetic" = generated test tone
     *                  - "file:path/to/file.wav" = WAV file playback
     * @return Device instance, or nullptr for unknown ids
     */
    static std::unique_ptr<IAudioInputDevice> create_device(const std::string& device_id = "");

    /**
     * @brief Check whether the factory understands a device id
     */
    static bool is_device_available(const std::string& device_id);
};

} // namespace audio
