#include "core/config.hpp"
#include <cstdlib>
#include <sstream>

namespace core {

const char* const kSpatialSystemInstruction =
    "You are a spatial reasoning expert.\n"
    "Your task is to detect objects in the video stream and provide their locations using normalized bounding boxes.\n"
    "A bounding box is a list of four numbers: [ymin, xmin, ymax, xmax] where each number is between 0 and 1000.\n"
    "Always mention the labels of the objects you find and follow it with their box coordinates.\n"
    "Example: \"I see a coffee cup at [200, 300, 450, 500] and a laptop at [600, 100, 950, 800].\"\n"
    "Focus on responding naturally to the user while performing this visual detection.\n"
    "Keep your verbal responses concise and always prioritize accuracy in coordinates.\n";

namespace {
bool to_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') return false;
    out = static_cast<int>(v);
    return true;
}
} // namespace

bool parse_args(int argc, char** argv, AppOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& value) {
            if (i + 1 >= argc) {
                error = "missing value for " + a;
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (a == "-v" || a == "--verbose") {
            options.verbose = true;
        } else if (a == "--model") {
            if (!next(value)) return false;
            options.session.model = value;
        } else if (a == "--voice") {
            if (!next(value)) return false;
            options.session.voice = value;
        } else if (a == "--input") {
            if (!next(value)) return false;
            if (value != "synthetic" && value.rfind("file:", 0) != 0) {
                error = "--input must be 'synthetic' or 'file:<path>'";
                return false;
            }
            options.session.audio_input = value;
        } else if (a == "--record") {
            if (!next(value)) return false;
            options.record_path = value;
        } else if (a == "--script") {
            if (!next(value)) return false;
            options.script_path = value;
        } else if (a == "--duration") {
            if (!next(value)) return false;
            if (!to_int(value, options.duration_s) || options.duration_s <= 0) {
                error = "--duration must be a positive number of seconds";
                return false;
            }
        } else if (a == "--frame-interval") {
            if (!next(value)) return false;
            if (!to_int(value, options.session.frame_interval_ms) || options.session.frame_interval_ms <= 0) {
                error = "--frame-interval must be a positive number of milliseconds";
                return false;
            }
        } else if (a == "-h" || a == "--help") {
            error = "help";
            return false;
        } else {
            error = "unknown argument: " + a;
            return false;
        }
    }
    return true;
}

std::string usage(const char* argv0) {
    std::ostringstream os;
    os << "Usage: " << argv0 << " [options]\n"
       << "  --input synthetic|file:<path.wav>  microphone source (default synthetic)\n"
       << "  --record <path.wav>                write model audio to a WAV file\n"
       << "  --script <path>                    scripted channel events (default built-in demo)\n"
       << "  --duration <seconds>               session length (default 10)\n"
       << "  --frame-interval <ms>              video frame cadence (default 500)\n"
       << "  --model <name>                     remote model name\n"
       << "  --voice <name>                     response voice\n"
       << "  -v, --verbose                      debug logging\n";
    return os.str();
}

}
