#include <cassert>
#include <cmath>
#include <vector>
#include "audio/capture_resampler.hpp"

using audio::CaptureResampler;

static void test_48k_to_16k() {
    CaptureResampler rs(48000, 16000, 4800);
    std::vector<int16_t> in(4800);
    for (size_t i = 0; i < in.size(); ++i) in[i] = static_cast<int16_t>(i);

    size_t bytes = rs.process(in.data(), in.size());
    assert(bytes == 3200);
    assert(rs.size() == 3200);
    assert(rs.sample_count() == 1600);
    for (size_t i = 0; i < rs.sample_count(); ++i) {
        assert(rs.samples()[i] == static_cast<int16_t>(3 * i));
    }

    // Steady stream: every further frame also yields exactly 1600 samples
    for (int f = 0; f < 5; ++f) {
        assert(rs.process(in.data(), in.size()) == 3200);
    }
}

static void test_little_endian_packing() {
    CaptureResampler rs(16000, 16000, 8);
    std::vector<int16_t> in(8, 0x1234);
    in[0] = -2;
    size_t bytes = rs.process(in.data(), in.size());
    assert(bytes >= 4);
    const uint8_t* p = rs.data();
    assert(p[0] == 0xFE && p[1] == 0xFF);
    assert(p[2] == 0x34 && p[3] == 0x12);
}

static void test_44k1_rate() {
    CaptureResampler rs(44100, 16000, 4096);
    std::vector<int16_t> in(4096, 100);
    size_t total = 0;
    const int frames = 50;
    for (int f = 0; f < frames; ++f) {
        rs.process(in.data(), in.size());
        total += rs.sample_count();
        for (size_t i = 0; i < rs.sample_count(); ++i) {
            assert(rs.samples()[i] == 100);
        }
    }
    // Output length tracks the exact rate ratio over the whole stream
    const double expected = frames * 4096.0 * 16000.0 / 44100.0;
    assert(std::abs(static_cast<double>(total) - expected) <= 2.0);
}

static void test_oversized_frame_and_reset() {
    CaptureResampler rs(48000, 16000, 480);
    std::vector<int16_t> in(4800, 1);
    assert(rs.process(in.data(), in.size()) == 3200);
    assert(rs.process(nullptr, 10) == 0);
    rs.reset();
    assert(rs.process(in.data(), 480) == 320);
}

int main() {
    test_48k_to_16k();
    test_little_endian_packing();
    test_44k1_rate();
    test_oversized_frame_and_reset();
    return 0;
}
