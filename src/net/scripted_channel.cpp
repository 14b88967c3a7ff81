#include "net/scripted_channel.hpp"
#include "core/logging.hpp"

#include <chrono>
#include <cmath>
#include <sstream>

namespace net {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) {
        return std::string();
    }
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

ScriptStep step(int delay_ms, ChannelEvent event) {
    ScriptStep s;
    s.delay_ms = delay_ms;
    s.event = std::move(event);
    return s;
}

} // namespace

ScriptedChannel::ScriptedChannel() = default;

ScriptedChannel::ScriptedChannel(std::vector<ScriptStep> script) : script_(std::move(script)) {}

ScriptedChannel::~ScriptedChannel() {
    close();
}

bool ScriptedChannel::open(const ChannelConfig& config, EventSink sink, std::string& error) {
    if (!open_) {
        close();  // reap a script thread left over from a remote close
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) {
        error = "channel already open";
        return false;
    }
    if (fail_open_) {
        error = fail_reason_;
        return false;
    }
    if (!sink) {
        error = "no event sink";
        return false;
    }

    config_ = config;
    sink_ = std::move(sink);
    cancel_ = false;
    script_finished_ = false;
    open_ = true;
    ++open_count_;

    core::log_info("[ScriptedChannel] Opening session: model=" + config.model +
                   " voice=" + config.voice + " steps=" + std::to_string(script_.size()));

    script_thread_ = std::make_unique<std::thread>(&ScriptedChannel::script_thread_func, this);
    return true;
}

bool ScriptedChannel::send_audio(const uint8_t* data, size_t size, int sample_rate) {
    if (!open_ || !data || size == 0) {
        return false;
    }
    audio_bytes_sent_ += size;
    ++audio_chunks_sent_;
    last_audio_rate_ = sample_rate;
    return true;
}

bool ScriptedChannel::send_video(const video::VideoFrame& frame) {
    if (!open_ || frame.data.empty()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_video_mime_ = frame.mime_type;
    }
    ++video_frames_sent_;
    return true;
}

void ScriptedChannel::close() {
    std::unique_ptr<std::thread> thread;
    EventSink sink;
    bool was_open = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_open = open_;
        open_ = false;
        cancel_ = true;
        thread = std::move(script_thread_);
        if (was_open) {
            sink = std::move(sink_);
        }
        sink_ = nullptr;
    }
    cv_.notify_all();
    // The script thread may still be alive after a remote close
    if (thread && thread->joinable()) {
        if (thread->get_id() == std::this_thread::get_id()) {
            thread->detach();
        } else {
            thread->join();
        }
    }
    if (!was_open) {
        return;
    }
    ++close_count_;

    if (sink) {
        sink(ChannelEvent::closed());
    }
    core::log_info("[ScriptedChannel] Closed");
}

void ScriptedChannel::emit(ChannelEvent event) {
    EventSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return;
        }
        sink = sink_;
    }
    if (sink) {
        sink(std::move(event));
    }
}

void ScriptedChannel::set_script(std::vector<ScriptStep> script) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_ = std::move(script);
}

void ScriptedChannel::set_fail_open(bool fail, std::string reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_open_ = fail;
    fail_reason_ = std::move(reason);
}

std::string ScriptedChannel::last_video_mime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_video_mime_;
}

ChannelConfig ScriptedChannel::last_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void ScriptedChannel::script_thread_func() {
    std::vector<ScriptStep> script;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        script = script_;
    }

    if (auto_open_) {
        emit(ChannelEvent::opened());
    }

    for (auto& s : script) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(s.delay_ms);
            if (cv_.wait_until(lock, deadline, [this] { return cancel_; })) {
                return;
            }
        }

        if (s.event.type == ChannelEvent::Type::CLOSED) {
            // Remote close: deliver CLOSED and drop the session
            EventSink sink;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!open_) {
                    return;
                }
                open_ = false;
                cancel_ = true;
                sink = std::move(sink_);
                sink_ = nullptr;
            }
            if (sink) {
                sink(ChannelEvent::closed());
            }
            script_finished_ = true;
            return;
        }

        emit(std::move(s.event));
    }
    script_finished_ = true;
}

bool ScriptedChannel::parse_script(const std::string& text, std::vector<ScriptStep>& steps, std::string& error) {
    steps.clear();
    std::istringstream in(text);
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        std::istringstream fields(line);
        int delay = 0;
        std::string command;
        if (!(fields >> delay) || delay < 0 || !(fields >> command)) {
            error = "line " + std::to_string(line_no) + ": expected '<delay_ms> <command>'";
            return false;
        }
        std::string rest;
        std::getline(fields, rest);
        if (!rest.empty() && rest[0] == ' ') {
            rest.erase(0, 1);
        }

        if (command == "out") {
            steps.push_back(step(delay, ChannelEvent::output_transcription(rest)));
        } else if (command == "in") {
            steps.push_back(step(delay, ChannelEvent::input_transcription(rest)));
        } else if (command == "turn") {
            steps.push_back(step(delay, ChannelEvent::turn_complete()));
        } else if (command == "interrupt") {
            steps.push_back(step(delay, ChannelEvent::interrupted()));
        } else if (command == "error") {
            steps.push_back(step(delay, ChannelEvent::error(rest.empty() ? "scripted error" : rest)));
        } else if (command == "close") {
            steps.push_back(step(delay, ChannelEvent::closed()));
        } else if (command == "tone") {
            std::istringstream args(rest);
            double hz = 0.0;
            double seconds = 0.0;
            if (!(args >> hz >> seconds) || hz <= 0.0 || seconds <= 0.0) {
                error = "line " + std::to_string(line_no) + ": tone needs <hz> <seconds>";
                return false;
            }
            steps.push_back(step(delay, ChannelEvent::audio_segment(make_tone(hz, seconds), 24000, 1)));
        } else {
            error = "line " + std::to_string(line_no) + ": unknown command '" + command + "'";
            return false;
        }
    }
    return true;
}

std::vector<ScriptStep> ScriptedChannel::demo_script() {
    std::vector<ScriptStep> s;
    s.push_back(step(300, ChannelEvent::input_transcription("What do you see")));
    s.push_back(step(100, ChannelEvent::input_transcription(" on my desk?")));
    s.push_back(step(400, ChannelEvent::output_transcription("I can see a coffee cup [420, 120, 610, 260]")));
    s.push_back(step(50, ChannelEvent::audio_segment(make_tone(330.0, 0.6), 24000, 1)));
    s.push_back(step(200, ChannelEvent::output_transcription(" and a laptop [300, 400, 7")));
    s.push_back(step(100, ChannelEvent::output_transcription("20, 880]")));
    s.push_back(step(50, ChannelEvent::audio_segment(make_tone(392.0, 0.6), 24000, 1)));
    s.push_back(step(300, ChannelEvent::turn_complete()));
    s.push_back(step(500, ChannelEvent::input_transcription("Wait, where is the cup now?")));
    s.push_back(step(100, ChannelEvent::output_transcription(" The cup moved [430, 150, 620, 290]")));
    s.push_back(step(50, ChannelEvent::audio_segment(make_tone(440.0, 1.5), 24000, 1)));
    s.push_back(step(300, ChannelEvent::interrupted()));
    s.push_back(step(200, ChannelEvent::output_transcription(" Also a phone [700, 50, 800, 150]")));
    s.push_back(step(50, ChannelEvent::audio_segment(make_tone(494.0, 0.4), 24000, 1)));
    s.push_back(step(300, ChannelEvent::turn_complete()));
    return s;
}

std::vector<uint8_t> ScriptedChannel::make_tone(double hz, double seconds, int sample_rate) {
    const double kPi = 3.14159265358979323846;
    size_t frames = static_cast<size_t>(seconds * sample_rate);
    std::vector<uint8_t> bytes(frames * 2);
    for (size_t i = 0; i < frames; ++i) {
        double v = 0.25 * std::sin(2.0 * kPi * hz * static_cast<double>(i) / sample_rate);
        int16_t s = static_cast<int16_t>(std::lround(v * 32767.0));
        bytes[2 * i] = static_cast<uint8_t>(s & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>((static_cast<uint16_t>(s) >> 8) & 0xFF);
    }
    return bytes;
}

} // namespace net
