#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace audio {

/**
 * @brief Pull callback for output devices
 *
 * Called from the device thread to fill `frames` mono PCM16 samples.
 * Must not block.
 */
using RenderCallback = std::function<void(int16_t* out, size_t frames)>;

/**
 * @brief Abstract base class for audio output devices
 *
 * Implementations:
 * - AudioOutputDevice_Null (paced render, discards audio)
 * - AudioOutputDevice_Wav  (paced render, records to a WAV file)
 */
class IAudioOutputDevice {
public:
    virtual ~IAudioOutputDevice() = default;

    /**
     * @brief Start pulling audio
     * @param sample_rate Rate of the rendered mono stream
     * @param render Called on the device thread for each block
     * @return true if the device started
     */
    virtual bool start(int sample_rate, RenderCallback render) = 0;

    /**
     * @brief Stop pulling audio. Synchronous; safe to call when stopped.
     */
    virtual void stop() = 0;

    virtual bool is_running() const = 0;

    /// Human-readable device description
    virtual std::string name() const = 0;
};

} // namespace audio
