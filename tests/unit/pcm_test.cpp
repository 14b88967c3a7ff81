#include <cassert>
#include <string>
#include <vector>
#include "audio/pcm.hpp"

using namespace audio;

static void test_decode_mono() {
    const uint8_t bytes[] = {0x34, 0x12, 0xFE, 0xFF, 0x00, 0x80};
    AudioSegment seg;
    std::string error;
    assert(decode_pcm16le(bytes, sizeof(bytes), 24000, 1, seg, error));
    assert(seg.samples.size() == 3);
    assert(seg.samples[0] == 0x1234);
    assert(seg.samples[1] == -2);
    assert(seg.samples[2] == -32768);
    assert(seg.sample_rate == 24000);
    assert(seg.duration_seconds == 3.0 / 24000.0);
}

static void test_decode_stereo_downmix() {
    std::vector<int16_t> interleaved{100, 300, -50, -150};
    std::vector<uint8_t> bytes;
    encode_pcm16le(interleaved.data(), interleaved.size(), bytes);
    assert(bytes.size() == 8);

    AudioSegment seg;
    std::string error;
    assert(decode_pcm16le(bytes.data(), bytes.size(), 48000, 2, seg, error));
    assert(seg.samples.size() == 2);
    assert(seg.samples[0] == 200);
    assert(seg.samples[1] == -100);
}

static void test_decode_failures() {
    AudioSegment seg;
    std::string error;
    const uint8_t odd[] = {1, 2, 3};
    assert(!decode_pcm16le(odd, sizeof(odd), 24000, 1, seg, error));
    assert(!error.empty());

    error.clear();
    assert(!decode_pcm16le(nullptr, 0, 24000, 1, seg, error));
    assert(!error.empty());

    const uint8_t ok[] = {1, 2, 3, 4};
    assert(!decode_pcm16le(ok, sizeof(ok), 0, 1, seg, error));
    assert(!decode_pcm16le(ok, sizeof(ok), 24000, 0, seg, error));
    assert(!decode_pcm16le(ok, 2, 24000, 2, seg, error));
}

static void test_resample_linear() {
    std::vector<int16_t> in(480, 10);
    std::vector<int16_t> out;
    resample_linear(in.data(), in.size(), 48000, 16000, out);
    assert(out.size() == 160);
    for (int16_t v : out) assert(v == 10);

    resample_linear(in.data(), in.size(), 16000, 16000, out);
    assert(out.size() == 480);

    resample_linear(in.data(), 0, 16000, 24000, out);
    assert(out.empty());
}

static void test_resample_to_exact_length() {
    std::vector<int16_t> in = {0, 100, 200, 300};
    std::vector<int16_t> out;
    resample_linear_frames(in.data(), in.size(), 7, out);
    assert(out.size() == 7);
    assert(out.front() == 0);
    assert(out.back() == 300);
    for (size_t i = 1; i < out.size(); ++i) assert(out[i] >= out[i - 1]);

    resample_linear_frames(in.data(), in.size(), 0, out);
    assert(out.empty());
}

int main() {
    test_decode_mono();
    test_decode_stereo_downmix();
    test_decode_failures();
    test_resample_linear();
    test_resample_to_exact_length();
    return 0;
}
