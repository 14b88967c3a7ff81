#include <cassert>
#include <cmath>
#include <map>
#include <vector>
#include "audio/audio_mixer.hpp"
#include "audio/playback_scheduler.hpp"

using namespace audio;

// Engine with a hand-driven clock
class FakeEngine : public IPlaybackEngine {
public:
    double now = 0.0;
    std::map<SourceId, EndedCallback> live;
    std::vector<double> starts;
    std::vector<SourceId> stop_calls;
    SourceId next = 1;

    double current_time() const override { return now; }
    int sample_rate() const override { return 24000; }

    SourceId start_source(std::shared_ptr<const AudioSegment>, double start_time,
                          EndedCallback on_ended) override {
        starts.push_back(start_time);
        live[next] = on_ended;
        return next++;
    }

    void stop_source(SourceId id) override {
        stop_calls.push_back(id);
        auto it = live.find(id);
        if (it == live.end()) return;
        auto cb = it->second;
        live.erase(it);
        cb(id, true);
    }

    void finish(SourceId id) {
        auto it = live.find(id);
        assert(it != live.end());
        auto cb = it->second;
        live.erase(it);
        cb(id, false);
    }
};

static AudioSegment segment(double seconds, int rate = 24000) {
    AudioSegment s;
    s.sample_rate = rate;
    s.samples.assign(static_cast<size_t>(seconds * rate), 1000);
    s.duration_seconds = static_cast<double>(s.samples.size()) / rate;
    return s;
}

static void test_gapless() {
    FakeEngine engine;
    PlaybackScheduler scheduler(engine);
    engine.now = 1.0;
    auto a = scheduler.schedule(segment(0.5));
    auto b = scheduler.schedule(segment(0.25));
    assert(a.handle != kInvalidPlayback && b.handle != kInvalidPlayback);
    assert(a.start_time == 1.0);
    assert(b.start_time == a.start_time + a.duration);
    assert(scheduler.next_start_time() == b.start_time + b.duration);
    assert(scheduler.active_count() == 2);

    // Arriving late starts at the clock, not the stale cursor
    engine.now = 5.0;
    auto c = scheduler.schedule(segment(0.1));
    assert(c.start_time == 5.0);
}

static void test_completion_leaves_registry() {
    FakeEngine engine;
    PlaybackScheduler scheduler(engine);
    auto a = scheduler.schedule(segment(0.5));
    assert(scheduler.is_active(a.handle));
    engine.finish(1);
    assert(!scheduler.is_active(a.handle));
    assert(scheduler.active_count() == 0);
}

static void test_interrupt() {
    FakeEngine engine;
    PlaybackScheduler scheduler(engine);
    engine.now = 2.0;
    scheduler.schedule(segment(1.0));
    scheduler.schedule(segment(1.0));
    scheduler.schedule(segment(1.0));
    assert(scheduler.next_start_time() == 5.0);

    engine.now = 2.4;
    assert(scheduler.interrupt() == 3);
    assert(scheduler.active_count() == 0);
    assert(scheduler.next_start_time() == 0.0);
    assert(engine.live.empty());
    assert(scheduler.interrupted_count() == 3);

    auto next = scheduler.schedule(segment(0.5));
    assert(next.start_time >= 2.4);
    assert(next.start_time < 5.0);

    // Nothing active: interrupt is a no-op
    engine.finish(4);
    assert(scheduler.interrupt() == 0);
}

static void test_stop_after_completion_is_noop() {
    FakeEngine engine;
    PlaybackScheduler scheduler(engine);
    scheduler.schedule(segment(0.5));
    engine.finish(1);
    engine.stop_source(1);
    assert(scheduler.stop_all() == 0);
    assert(scheduler.active_count() == 0);
}

static void test_invalid_segment_does_not_move_cursor() {
    FakeEngine engine;
    PlaybackScheduler scheduler(engine);
    scheduler.schedule(segment(0.5));
    double cursor = scheduler.next_start_time();
    AudioSegment empty;
    empty.sample_rate = 24000;
    auto r = scheduler.schedule(empty);
    assert(r.handle == kInvalidPlayback);
    assert(scheduler.next_start_time() == cursor);
    assert(scheduler.scheduled_count() == 1);
}

static void test_with_mixer_clock() {
    AudioMixer mixer(24000);
    PlaybackScheduler scheduler(mixer);
    std::vector<int16_t> out(2400);

    auto a = scheduler.schedule(segment(0.1));   // 2400 frames
    auto b = scheduler.schedule(segment(0.1));
    assert(a.start_time == 0.0);
    assert(std::fabs(b.start_time - 0.1) < 1e-9);

    mixer.render(out.data(), out.size());
    assert(out[0] == 1000 && out[2399] == 1000);
    assert(!scheduler.is_active(a.handle));
    assert(scheduler.is_active(b.handle));

    mixer.render(out.data(), 1200);
    assert(scheduler.interrupt() == 1);
    assert(mixer.active_sources() == 0);
    auto c = scheduler.schedule(segment(0.1));
    assert(std::fabs(c.start_time - mixer.current_time()) < 1e-9);
}

int main() {
    test_gapless();
    test_completion_leaves_registry();
    test_interrupt();
    test_stop_after_completion_is_noop();
    test_invalid_segment_does_not_move_cursor();
    test_with_mixer_clock();
    return 0;
}
