#include <cassert>
#include <memory>
#include <vector>
#include "audio/audio_mixer.hpp"

using namespace audio;

static std::shared_ptr<const AudioSegment> make_segment(size_t frames, int16_t value, int rate = 24000) {
    auto s = std::make_shared<AudioSegment>();
    s->sample_rate = rate;
    s->samples.assign(frames, value);
    s->duration_seconds = static_cast<double>(frames) / rate;
    return s;
}

static void test_clock_and_offset() {
    AudioMixer mixer(24000);
    assert(mixer.current_time() == 0.0);

    int ended = 0;
    bool was_stopped = true;
    // Starts 100 frames into the first block
    SourceId id = mixer.start_source(make_segment(50, 500), 100.0 / 24000.0,
                                     [&](SourceId, bool stopped) { ended++; was_stopped = stopped; });
    assert(id != kInvalidSource);

    std::vector<int16_t> out(240);
    mixer.render(out.data(), out.size());
    assert(out[99] == 0);
    assert(out[100] == 500);
    assert(out[149] == 500);
    assert(out[150] == 0);
    assert(ended == 1);
    assert(!was_stopped);
    assert(mixer.frames_rendered() == 240);
    assert(mixer.current_time() == 240.0 / 24000.0);
    assert(mixer.active_sources() == 0);
}

static void test_past_start_plays_now() {
    AudioMixer mixer(24000);
    std::vector<int16_t> out(100);
    mixer.render(out.data(), out.size());
    mixer.start_source(make_segment(10, 7), 0.0, nullptr);
    mixer.render(out.data(), out.size());
    assert(out[0] == 7);
    assert(out[9] == 7);
    assert(out[10] == 0);
}

static void test_saturating_mix() {
    AudioMixer mixer(24000);
    mixer.start_source(make_segment(4, 30000), 0.0, nullptr);
    mixer.start_source(make_segment(4, 30000), 0.0, nullptr);
    mixer.start_source(make_segment(4, -5), 0.0, nullptr);
    std::vector<int16_t> out(4);
    mixer.render(out.data(), out.size());
    assert(out[0] == 32767);
}

static void test_stop_source() {
    AudioMixer mixer(24000);
    int calls = 0;
    bool stopped_flag = false;
    SourceId id = mixer.start_source(make_segment(1000, 1), 0.0,
                                     [&](SourceId, bool stopped) { calls++; stopped_flag = stopped; });
    mixer.stop_source(id);
    assert(calls == 1);
    assert(stopped_flag);
    // Second stop is a no-op
    mixer.stop_source(id);
    assert(calls == 1);

    std::vector<int16_t> out(10);
    mixer.render(out.data(), out.size());
    assert(out[0] == 0);
}

static void test_resamples_foreign_rate() {
    AudioMixer mixer(24000);
    int ended = 0;
    mixer.start_source(make_segment(1600, 100, 16000), 0.0, [&](SourceId, bool) { ended++; });
    std::vector<int16_t> out(2399);
    mixer.render(out.data(), out.size());
    assert(ended == 0);
    mixer.render(out.data(), 1);
    assert(ended == 1);
}

static void test_foreign_rate_segments_meet_exactly() {
    // 1001 frames at 16 kHz is 1501.5 frames at 24 kHz, so each boundary
    // falls between two output frames
    AudioMixer mixer(24000);
    const double duration = 1001.0 / 16000.0;
    double start = 0.0;
    for (int i = 0; i < 3; ++i) {
        assert(mixer.start_source(make_segment(1001, 100, 16000), start, nullptr) != kInvalidSource);
        start += duration;
    }

    std::vector<int16_t> out(4800);
    for (size_t offset = 0; offset < out.size(); offset += 480) {
        mixer.render(out.data() + offset, 480);
    }
    for (size_t i = 0; i < 4503; ++i) {
        assert(out[i] == 100);  // 0 would be a gap, 200 an overlap
    }
    for (size_t i = 4506; i < out.size(); ++i) {
        assert(out[i] == 0);
    }
    assert(mixer.active_sources() == 0);
}

static void test_rejects_empty() {
    AudioMixer mixer(24000);
    assert(mixer.start_source(nullptr, 0.0, nullptr) == kInvalidSource);
    assert(mixer.start_source(make_segment(0, 0), 0.0, nullptr) == kInvalidSource);
}

int main() {
    test_clock_and_offset();
    test_past_start_plays_now();
    test_saturating_mix();
    test_stop_source();
    test_resamples_foreign_rate();
    test_foreign_rate_segments_meet_exactly();
    test_rejects_empty();
    return 0;
}
