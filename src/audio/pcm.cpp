#include "audio/pcm.hpp"
#include <algorithm>
#include <cmath>

namespace audio {

bool decode_pcm16le(const uint8_t* bytes, size_t size, int sample_rate, int channels,
                    AudioSegment& out, std::string& error) {
    if (bytes == nullptr || size == 0) {
        error = "empty audio payload";
        return false;
    }
    if (sample_rate <= 0) {
        error = "invalid sample rate " + std::to_string(sample_rate);
        return false;
    }
    if (channels <= 0) {
        error = "invalid channel count " + std::to_string(channels);
        return false;
    }
    const size_t frame_bytes = 2 * static_cast<size_t>(channels);
    if (size % frame_bytes != 0) {
        error = "payload of " + std::to_string(size) + " bytes is not a whole number of " +
                std::to_string(channels) + "-channel PCM16 frames";
        return false;
    }

    const size_t frames = size / frame_bytes;
    out.samples.resize(frames);
    for (size_t i = 0; i < frames; ++i) {
        int32_t sum = 0;
        for (int c = 0; c < channels; ++c) {
            const uint8_t* p = bytes + i * frame_bytes + 2 * static_cast<size_t>(c);
            sum += static_cast<int16_t>(static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8));
        }
        out.samples[i] = static_cast<int16_t>(sum / channels);
    }
    out.sample_rate = sample_rate;
    out.duration_seconds = static_cast<double>(frames) / static_cast<double>(sample_rate);
    return true;
}

void encode_pcm16le(const int16_t* samples, size_t count, std::vector<uint8_t>& out) {
    out.resize(count * 2);
    for (size_t i = 0; i < count; ++i) {
        const uint16_t v = static_cast<uint16_t>(samples[i]);
        out[2 * i] = static_cast<uint8_t>(v & 0xFF);
        out[2 * i + 1] = static_cast<uint8_t>(v >> 8);
    }
}

void resample_linear(const int16_t* in, size_t in_frames, int in_sr, int out_sr, std::vector<int16_t>& out) {
    if (in_sr <= 0 || out_sr <= 0 || in_frames == 0) { out.clear(); return; }
    if (in_sr == out_sr) {
        out.assign(in, in + in_frames);
        return;
    }
    const double ratio = static_cast<double>(out_sr) / static_cast<double>(in_sr);
    resample_linear_frames(in, in_frames, static_cast<size_t>(std::llround(in_frames * ratio)), out);
}

void resample_linear_frames(const int16_t* in, size_t in_frames, size_t out_frames, std::vector<int16_t>& out) {
    if (in == nullptr || in_frames == 0 || out_frames == 0) { out.clear(); return; }
    const double ratio = static_cast<double>(out_frames) / static_cast<double>(in_frames);
    out.resize(out_frames);
    for (size_t i = 0; i < out_frames; ++i) {
        double src_pos = i / ratio;
        size_t i0 = static_cast<size_t>(src_pos);
        if (i0 >= in_frames - 1) { out[i] = in[in_frames - 1]; continue; }
        size_t i1 = i0 + 1;
        double frac = src_pos - static_cast<double>(i0);
        double v = (1.0 - frac) * static_cast<double>(in[i0]) + frac * static_cast<double>(in[i1]);
        int vi = static_cast<int>(std::lrint(v));
        out[i] = static_cast<int16_t>(std::clamp(vi, -32768, 32767));
    }
}

} // namespace audio
