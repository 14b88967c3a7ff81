#include <cassert>
#include <string>
#include <vector>
#include "core/config.hpp"

static bool parse(std::vector<std::string> args, core::AppOptions& options, std::string& error) {
    std::vector<char*> argv;
    static std::string prog = "spatial_console";
    argv.push_back(&prog[0]);
    for (auto& a : args) argv.push_back(&a[0]);
    return core::parse_args(static_cast<int>(argv.size()), argv.data(), options, error);
}

static void test_defaults() {
    core::SessionConfig config;
    assert(config.voice == "Kore");
    assert(config.capture_target_rate == 16000);
    assert(config.capture_frame_samples == 4096);
    assert(config.video_width == 1280 && config.video_height == 720);
    assert(config.video_fps == 15);
    assert(config.frame_interval_ms == 500);
    assert(config.model_audio_rate == 24000);
    assert(config.parser_buffer_chars == 500);
    assert(config.match_distance == 200.0);
    assert(config.object_ttl_ms == 3000);
    assert(config.prune_interval_ms == 500);
    assert(config.audio_input == "synthetic");
    assert(config.system_instruction.find("[ymin, xmin, ymax, xmax]") != std::string::npos);
}

static void test_flags() {
    core::AppOptions options;
    std::string error;
    assert(parse({"--model", "m1", "--voice", "Puck", "--duration", "3",
                  "--input", "file:talk.wav", "--record", "out.wav",
                  "--script", "demo.txt", "--frame-interval", "250", "-v"}, options, error));
    assert(options.session.model == "m1");
    assert(options.session.voice == "Puck");
    assert(options.duration_s == 3);
    assert(options.session.audio_input == "file:talk.wav");
    assert(options.record_path == "out.wav");
    assert(options.script_path == "demo.txt");
    assert(options.session.frame_interval_ms == 250);
    assert(options.verbose);
}

static void test_bad_usage() {
    core::AppOptions options;
    std::string error;
    assert(!parse({"--duration", "zero"}, options, error));
    assert(!error.empty());
    assert(!parse({"--input", "mic0"}, options, error));
    assert(!parse({"--model"}, options, error));
    assert(error == "missing value for --model");
    assert(!parse({"--bogus"}, options, error));
    assert(!parse({"--help"}, options, error));
    assert(error == "help");
    assert(core::usage("x").find("--script") != std::string::npos);
}

int main() {
    test_defaults();
    test_flags();
    test_bad_usage();
    return 0;
}
