#pragma once
#include <cstddef>
#include <string>

namespace core {

/// Default prompt asking the model to ground what it sees as [ymin, xmin, ymax, xmax] boxes.
extern const char* const kSpatialSystemInstruction;

/// Configuration for one streaming session
struct SessionConfig {
    // Remote model
    std::string model = "gemini-2.5-flash-native-audio-preview-09-2025";  ///< Remote model name
    std::string system_instruction = kSpatialSystemInstruction;             ///< Prompt sent at session setup
    std::string voice = "Kore";                                             ///< Prebuilt voice for audio responses

    // Outbound audio
    std::string audio_input = "synthetic"; ///< Capture device: "synthetic" or "file:<path.wav>"
    int capture_target_rate = 16000;      ///< Sample rate sent upstream (PCM16 LE mono)
    int capture_frame_samples = 4096;     ///< Samples per capture callback block
    int uplink_interval_ms = 20;          ///< How often captured audio is flushed to the channel

    // Outbound video
    int video_width = 1280;               ///< Requested capture width
    int video_height = 720;               ///< Requested capture height
    int video_fps = 15;                   ///< Requested capture frame rate
    int frame_interval_ms = 500;          ///< Cadence of frames sent to the model

    // Inbound audio
    int model_audio_rate = 24000;         ///< Rate of model audio segments when not stated otherwise
    int output_sample_rate = 24000;       ///< Rate of the local playback mixer

    // Detection / tracking
    size_t parser_buffer_chars = 500;     ///< Trailing text kept for split markers
    double match_distance = 200.0;        ///< Centre distance (0-1000 space) for identity match
    int object_ttl_ms = 3000;             ///< Tracked objects older than this are pruned
    int prune_interval_ms = 500;          ///< Cadence of the prune sweep

    // Plumbing
    size_t event_queue_capacity = 1024;   ///< Max pending inbound channel events
};

/// Console options layered over SessionConfig
struct AppOptions {
    SessionConfig session;
    std::string record_path;              ///< Write model audio to this WAV (empty = discard)
    std::string script_path;              ///< Scripted channel script (empty = built-in demo)
    int duration_s = 10;                  ///< How long the console session runs
    bool verbose = false;
};

/// Parse command-line flags into options. Returns false on bad usage;
/// the error is written to `error`.
bool parse_args(int argc, char** argv, AppOptions& options, std::string& error);

/// Usage text for the console tool
std::string usage(const char* argv0);

}
