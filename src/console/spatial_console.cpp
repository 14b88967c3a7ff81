// Copyright (c) 2025 VAM Spatial Live
// Console front end: runs one session against the scripted channel and
// prints state changes, tracked objects and the conversation as they happen.

#include "app/session_coordinator.hpp"
#include "audio/audio_input_device.hpp"
#include "audio/audio_output_device_null.hpp"
#include "audio/audio_output_device_wav.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "net/scripted_channel.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

using namespace app;

// Global flag for Ctrl+C handling
std::atomic<bool> g_should_stop{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_should_stop = true;
    }
}

// Color codes for terminal output
namespace color {
    const char* RESET = "\033[0m";
    const char* RED = "\033[31m";
    const char* GREEN = "\033[32m";
    const char* YELLOW = "\033[33m";
    const char* CYAN = "\033[36m";
    const char* MAGENTA = "\033[35m";
}

static bool load_script(const std::string& path, std::vector<net::ScriptStep>& steps, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return net::ScriptedChannel::parse_script(ss.str(), steps, error);
}

int main(int argc, char** argv) {
    core::AppOptions options;
    std::string error;
    if (!core::parse_args(argc, argv, options, error)) {
        if (error != "help") {
            std::cerr << "Error: " << error << "\n\n";
        }
        std::cerr << core::usage(argv[0]);
        return error == "help" ? 0 : 1;
    }
    core::set_log_level(options.verbose ? core::LogLevel::DEBUG : core::LogLevel::WARN);

    if (!audio::AudioInputFactory::is_device_available(options.session.audio_input)) {
        std::cerr << color::RED << "Unknown input device: " << options.session.audio_input
                  << color::RESET << "\n";
        return 1;
    }

    std::vector<net::ScriptStep> script = net::ScriptedChannel::demo_script();
    if (!options.script_path.empty() && !load_script(options.script_path, script, error)) {
        std::cerr << color::RED << "Script error: " << error << color::RESET << "\n";
        return 1;
    }

    std::cout << "==========================================================\n";
    std::cout << "  Spatial Live (scripted channel)\n";
    std::cout << "==========================================================\n";
    std::cout << "Model:    " << options.session.model << "\n";
    std::cout << "Voice:    " << options.session.voice << "\n";
    std::cout << "Input:    " << options.session.audio_input << "\n";
    std::cout << "Record:   " << (options.record_path.empty() ? "(none)" : options.record_path) << "\n";
    std::cout << "Duration: " << options.duration_s << " s\n\n";

    signal(SIGINT, signal_handler);

    net::ScriptedChannel* channel = nullptr;
    SessionDevices devices;
    devices.make_channel = [&script, &channel]() -> std::unique_ptr<net::IRealtimeChannel> {
        auto c = std::make_unique<net::ScriptedChannel>(script);
        channel = c.get();
        return c;
    };
    devices.make_audio_input = [&options]() {
        return audio::AudioInputFactory::create_device(options.session.audio_input);
    };
    devices.make_audio_output = [&options]() -> std::unique_ptr<audio::IAudioOutputDevice> {
        if (options.record_path.empty()) {
            return std::make_unique<audio::AudioOutputDevice_Null>();
        }
        return std::make_unique<audio::AudioOutputDevice_Wav>(options.record_path);
    };

    SessionCoordinator session(std::move(devices));

    session.subscribe_to_state([](ConnectionState state) {
        const char* c = state == ConnectionState::CONNECTED ? color::GREEN
                      : state == ConnectionState::ERROR ? color::RED : color::YELLOW;
        std::cout << c << "[state] " << to_string(state) << color::RESET << "\n";
    });

    session.subscribe_to_transcript([](const TranscriptEntry& entry) {
        bool user = entry.role == TranscriptEntry::Role::USER;
        std::cout << (user ? color::CYAN : color::MAGENTA)
                  << (user ? "Operator" : "AI Core") << ": " << color::RESET
                  << entry.text << "\n";
    });

    session.subscribe_to_objects([](const std::vector<vision::TrackedObject>& objects) {
        std::cout << "[objects] " << objects.size() << " tracked\n";
        for (const auto& obj : objects) {
            vision::PercentRect r = vision::to_percent_rect(obj);
            std::cout << "   #" << obj.id << " " << std::left << std::setw(12) << obj.label << std::right
                      << std::fixed << std::setprecision(1)
                      << " left " << r.left << "% top " << r.top << "% "
                      << r.width << "% x " << r.height << "%\n";
        }
    });

    session.subscribe_to_errors([](const SessionError& err) {
        const char* c = err.severity == SessionError::Severity::ERROR ? color::RED : color::YELLOW;
        std::cout << c << "[error] " << err.message;
        if (!err.details.empty()) {
            std::cout << " (" << err.details << ")";
        }
        std::cout << color::RESET << "\n";
    });

    if (!session.start(options.session)) {
        std::cerr << color::RED << "Failed to start session" << color::RESET << "\n";
        return 1;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(options.duration_s);
    while (!g_should_stop && std::chrono::steady_clock::now() < deadline) {
        ConnectionState state = session.get_state();
        if (state == ConnectionState::DISCONNECTED || state == ConnectionState::ERROR) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    SessionStats stats = session.get_stats();
    ConnectionState final_state = session.get_state();
    session.stop();

    std::cout << "\n==========================================================\n";
    std::cout << "  Session summary\n";
    std::cout << "==========================================================\n";
    std::cout << "Elapsed:            " << stats.elapsed_ms << " ms\n";
    std::cout << "Audio sent:         " << stats.audio_bytes_sent << " bytes\n";
    std::cout << "Frames sent:        " << stats.video_frames_sent << "\n";
    std::cout << "Segments played:    " << stats.segments_scheduled << "\n";
    std::cout << "Interruptions:      " << stats.interruptions << "\n";
    std::cout << "Detections:         " << stats.detections << "\n";
    std::cout << "Transcript entries: " << session.get_history().size() << "\n";
    if (channel) {
        std::cout << "Uplink chunks:      " << channel->audio_chunks_sent() << "\n";
    }

    return final_state == ConnectionState::ERROR ? 1 : 0;
}
