#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

/// Decoded model audio, mono PCM16.
struct AudioSegment {
    std::vector<int16_t> samples;
    int sample_rate = 0;
    double duration_seconds = 0.0;
};

/**
 * @brief Decode interleaved PCM16 little-endian bytes into a mono segment
 *
 * Multi-channel input is downmixed by averaging. Fails (returns false and
 * fills `error`) on empty input, non-positive rate or channel count, or a
 * byte count that is not a whole number of frames.
 */
bool decode_pcm16le(const uint8_t* bytes, size_t size, int sample_rate, int channels,
                    AudioSegment& out, std::string& error);

/// Pack mono int16 samples as little-endian bytes into `out` (resized).
void encode_pcm16le(const int16_t* samples, size_t count, std::vector<uint8_t>& out);

/// Linear-interpolation resample of a complete mono buffer.
void resample_linear(const int16_t* in, size_t in_frames, int in_sr, int out_sr, std::vector<int16_t>& out);

/// Same, stretched to exactly `out_frames` output frames.
void resample_linear_frames(const int16_t* in, size_t in_frames, size_t out_frames, std::vector<int16_t>& out);

} // namespace audio
