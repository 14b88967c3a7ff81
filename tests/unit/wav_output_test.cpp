#include <cassert>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>
#include "audio/audio_output_device_wav.hpp"
#include "audio/file_capture.hpp"
#include "core/logging.hpp"

using namespace audio;

static const char* kPath = "wav_output_test.wav";

static void render_constant(int16_t* out, size_t frames) {
    for (size_t i = 0; i < frames; ++i) out[i] = 1234;
}

static void test_records_rendered_blocks() {
    std::remove(kPath);
    {
        AudioOutputDevice_Wav device(kPath);
        assert(device.start(16000, render_constant));
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        device.stop();
        assert(!device.is_running());
        assert(device.frames_written() >= 160);
        assert(device.frames_written() % 160 == 0);
    }

    FileCapture reader;
    assert(reader.start_from_wav(kPath));
    assert(reader.sample_rate() == 16000);
    assert(reader.channels() == 1);
    std::vector<int16_t> chunk(160);
    assert(reader.read_chunk(chunk.data(), chunk.size()) == 160);
    assert(chunk.front() == 1234 && chunk.back() == 1234);
    std::remove(kPath);
}

static void test_restart_reopens_sink() {
    std::remove(kPath);
    AudioOutputDevice_Wav device(kPath);
    assert(device.start(24000, render_constant));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    device.stop();
    const uint64_t first = device.frames_written();
    assert(first > 0);

    // A second run truncates the file and counts from zero
    assert(device.start(24000, render_constant));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    device.stop();
    assert(device.frames_written() > 0);

    FileCapture reader;
    assert(reader.start_from_wav(kPath));
    assert(reader.sample_rate() == 24000);
    std::remove(kPath);
}

static void test_unwritable_path_fails_start() {
    AudioOutputDevice_Wav device("/nonexistent-dir/out.wav");
    assert(!device.start(24000, render_constant));
    assert(!device.is_running());
    device.stop();
    assert(device.frames_written() == 0);
}

int main() {
    core::set_log_level(core::LogLevel::WARN);
    test_records_rendered_blocks();
    test_restart_reopens_sink();
    test_unwritable_path_fails_start();
    return 0;
}
