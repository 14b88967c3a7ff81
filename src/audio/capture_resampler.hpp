#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

/**
 * @brief Converts native-rate microphone frames to the uplink format
 *
 * Runs on the capture callback: linear interpolation from the device rate
 * to the target rate (16 kHz), then packing as PCM16 little-endian bytes.
 *
 * Interpolation phase and the previous frame's last sample are carried
 * across calls, so consecutive frames resample as one continuous stream.
 *
 * Work is proportional to the frame size. All buffers are allocated up front
 * for `max_frame_samples`; a larger frame grows them once (and warns once).
 * No locks, no I/O. Not thread-safe: one instance per capture stream.
 */
class CaptureResampler {
public:
    CaptureResampler(int native_rate, int target_rate = 16000, size_t max_frame_samples = 4096);

    /// Resample and pack one frame. Returns the number of bytes now in data().
    size_t process(const int16_t* samples, size_t count);

    /// Packed bytes of the last process() call.
    const uint8_t* data() const { return packed_.data(); }
    size_t size() const { return packed_size_; }

    /// Resampled samples of the last process() call (before packing).
    const int16_t* samples() const { return resampled_.data(); }
    size_t sample_count() const { return resampled_count_; }

    /// Forget carried phase, e.g. when the device restarts.
    void reset();

    int native_rate() const { return native_rate_; }
    int target_rate() const { return target_rate_; }

    /// Largest output (in samples) that `frames` input samples can produce.
    size_t max_output_samples(size_t frames) const;

private:
    void ensure_capacity(size_t count);

    int native_rate_;
    int target_rate_;
    double step_;              // input samples advanced per output sample
    double pos_ = 0.0;         // next output position, relative to the current frame start
    int16_t prev_ = 0;         // last sample of the previous frame (position -1)
    bool has_prev_ = false;

    std::vector<int16_t> resampled_;
    std::vector<uint8_t> packed_;
    size_t resampled_count_ = 0;
    size_t packed_size_ = 0;
    size_t max_frame_samples_;
    bool warned_grow_ = false;
};

} // namespace audio
