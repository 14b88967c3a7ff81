#pragma once

#include "net/realtime_channel.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace net {

/// One scripted event, emitted `delay_ms` after the previous one
struct ScriptStep {
    int delay_ms = 0;
    ChannelEvent event;
};

/**
 * @brief In-process channel that replays a script of model events
 *
 * Stands in for the remote model in demos and tests:
 * - emits OPENED after open() (unless auto_open is off), then the script
 * - tests can inject events directly with emit()
 * - records uplink traffic (audio bytes, video frames)
 * - can be told to fail open() to exercise error paths
 *
 * Script text format, one step per line (`#` starts a comment):
 *   <delay_ms> out <text>          output transcription delta
 *   <delay_ms> in <text>           input transcription delta
 *   <delay_ms> turn                turn complete
 *   <delay_ms> tone <hz> <seconds> model audio segment (24 kHz mono)
 *   <delay_ms> interrupt           barge-in
 *   <delay_ms> error <detail>      runtime failure
 *   <delay_ms> close               remote close
 */
class ScriptedChannel : public IRealtimeChannel {
public:
    ScriptedChannel();
    explicit ScriptedChannel(std::vector<ScriptStep> script);
    ~ScriptedChannel() override;

    bool open(const ChannelConfig& config, EventSink sink, std::string& error) override;
    bool send_audio(const uint8_t* data, size_t size, int sample_rate) override;
    bool send_video(const video::VideoFrame& frame) override;
    void close() override;
    bool is_open() const override { return open_.load(); }

    /// Deliver an event now, from the calling thread. Ignored when closed.
    void emit(ChannelEvent event);

    void set_script(std::vector<ScriptStep> script);
    void set_fail_open(bool fail, std::string reason = "scripted open failure");
    void set_auto_open(bool auto_open) { auto_open_ = auto_open; }

    // Uplink statistics
    size_t audio_bytes_sent() const { return audio_bytes_sent_.load(); }
    size_t audio_chunks_sent() const { return audio_chunks_sent_.load(); }
    size_t video_frames_sent() const { return video_frames_sent_.load(); }
    int last_audio_rate() const { return last_audio_rate_.load(); }
    std::string last_video_mime() const;
    ChannelConfig last_config() const;
    size_t open_count() const { return open_count_.load(); }
    size_t close_count() const { return close_count_.load(); }

    /// True once every script step has been emitted
    bool script_finished() const { return script_finished_.load(); }

    /// Parse the text format above. Returns false and sets `error` on a bad line.
    static bool parse_script(const std::string& text, std::vector<ScriptStep>& steps, std::string& error);

    /// A short conversation with boxes, audio, a barge-in and a turn boundary.
    static std::vector<ScriptStep> demo_script();

    /// PCM16 LE sine burst at `sample_rate`, for scripted audio segments.
    static std::vector<uint8_t> make_tone(double hz, double seconds, int sample_rate = 24000);

private:
    void script_thread_func();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    EventSink sink_;
    ChannelConfig config_;
    std::vector<ScriptStep> script_;
    std::string fail_reason_;
    std::string last_video_mime_;
    bool fail_open_ = false;
    bool auto_open_ = true;
    bool cancel_ = false;

    std::unique_ptr<std::thread> script_thread_;
    std::atomic<bool> open_{false};
    std::atomic<bool> script_finished_{false};
    std::atomic<size_t> audio_bytes_sent_{0};
    std::atomic<size_t> audio_chunks_sent_{0};
    std::atomic<size_t> video_frames_sent_{0};
    std::atomic<int> last_audio_rate_{0};
    std::atomic<size_t> open_count_{0};
    std::atomic<size_t> close_count_{0};
};

} // namespace net
