#include "net/realtime_channel.hpp"

namespace net {

const char* to_string(ChannelEvent::Type type) {
    switch (type) {
        case ChannelEvent::Type::OPENED: return "opened";
        case ChannelEvent::Type::OUTPUT_TRANSCRIPTION: return "output_transcription";
        case ChannelEvent::Type::INPUT_TRANSCRIPTION: return "input_transcription";
        case ChannelEvent::Type::TURN_COMPLETE: return "turn_complete";
        case ChannelEvent::Type::AUDIO_SEGMENT: return "audio_segment";
        case ChannelEvent::Type::INTERRUPTED: return "interrupted";
        case ChannelEvent::Type::ERROR: return "error";
        case ChannelEvent::Type::CLOSED: return "closed";
    }
    return "unknown";
}

} // namespace net
