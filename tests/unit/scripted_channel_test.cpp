#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
#include "net/scripted_channel.hpp"

using namespace net;

struct Collector {
    std::mutex mutex;
    std::vector<ChannelEvent> events;

    EventSink sink() {
        return [this](ChannelEvent&& e) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(std::move(e));
        };
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return events.size();
    }

    bool wait_for(size_t n, int timeout_ms = 2000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (count() >= n) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return count() >= n;
    }
};

static void test_parse_script() {
    std::vector<ScriptStep> steps;
    std::string error;
    const char* text =
        "# greeting\n"
        "0 in hello there\n"
        "10 out a cup [1, 2, 3, 4]\n"
        "5 tone 440 0.1\n"
        "0 interrupt\n"
        "0 turn\n"
        "0 error boom\n"
        "\n"
        "0 close\n";
    assert(ScriptedChannel::parse_script(text, steps, error));
    assert(steps.size() == 7);
    assert(steps[0].event.type == ChannelEvent::Type::INPUT_TRANSCRIPTION);
    assert(steps[0].event.text == "hello there");
    assert(steps[1].delay_ms == 10);
    assert(steps[1].event.text == "a cup [1, 2, 3, 4]");
    assert(steps[2].event.type == ChannelEvent::Type::AUDIO_SEGMENT);
    assert(steps[2].event.audio.size() == 2400 * 2);
    assert(steps[2].event.sample_rate == 24000);
    assert(steps[3].event.type == ChannelEvent::Type::INTERRUPTED);
    assert(steps[4].event.type == ChannelEvent::Type::TURN_COMPLETE);
    assert(steps[5].event.text == "boom");
    assert(steps[6].event.type == ChannelEvent::Type::CLOSED);

    assert(!ScriptedChannel::parse_script("x out hi\n", steps, error));
    assert(!ScriptedChannel::parse_script("0 dance\n", steps, error));
    assert(error.find("line 1") != std::string::npos);
    assert(!ScriptedChannel::parse_script("0 tone 440\n", steps, error));
}

static void test_replay_and_uplink() {
    std::vector<ScriptStep> steps;
    std::string error;
    assert(ScriptedChannel::parse_script("0 out hi\n5 turn\n", steps, error));

    ScriptedChannel channel(steps);
    Collector c;
    ChannelConfig config;
    config.model = "m";
    assert(channel.open(config, c.sink(), error));
    assert(channel.is_open());
    assert(c.wait_for(3));
    for (int i = 0; i < 200 && !channel.script_finished(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(channel.script_finished());
    {
        std::lock_guard<std::mutex> lock(c.mutex);
        assert(c.events[0].type == ChannelEvent::Type::OPENED);
        assert(c.events[1].type == ChannelEvent::Type::OUTPUT_TRANSCRIPTION);
        assert(c.events[2].type == ChannelEvent::Type::TURN_COMPLETE);
    }
    assert(channel.last_config().model == "m");

    uint8_t pcm[64] = {0};
    assert(channel.send_audio(pcm, sizeof(pcm), 16000));
    video::VideoFrame frame;
    frame.data.assign(10, 1);
    frame.mime_type = "image/jpeg";
    assert(channel.send_video(frame));
    assert(channel.audio_bytes_sent() == 64);
    assert(channel.last_audio_rate() == 16000);
    assert(channel.video_frames_sent() == 1);
    assert(channel.last_video_mime() == "image/jpeg");

    channel.close();
    assert(!channel.is_open());
    assert(c.wait_for(4));
    {
        std::lock_guard<std::mutex> lock(c.mutex);
        assert(c.events[3].type == ChannelEvent::Type::CLOSED);
    }
    // Closed: sends and injected events are refused
    assert(!channel.send_audio(pcm, sizeof(pcm), 16000));
    channel.emit(ChannelEvent::turn_complete());
    assert(c.count() == 4);
    channel.close();
    assert(channel.close_count() == 1);
}

static void test_fail_open() {
    ScriptedChannel channel;
    channel.set_fail_open(true, "no network");
    Collector c;
    std::string error;
    assert(!channel.open(ChannelConfig(), c.sink(), error));
    assert(error == "no network");
    assert(!channel.is_open());
    assert(c.count() == 0);
}

static void test_remote_close_then_reopen() {
    std::vector<ScriptStep> steps;
    std::string error;
    assert(ScriptedChannel::parse_script("0 close\n", steps, error));
    ScriptedChannel channel(steps);
    Collector c;
    assert(channel.open(ChannelConfig(), c.sink(), error));
    assert(c.wait_for(2));
    assert(!channel.is_open());

    channel.set_script({});
    Collector again;
    assert(channel.open(ChannelConfig(), again.sink(), error));
    assert(again.wait_for(1));
    assert(channel.open_count() == 2);
    channel.close();
}

int main() {
    test_parse_script();
    test_replay_and_uplink();
    test_fail_open();
    test_remote_close_then_reopen();
    return 0;
}
