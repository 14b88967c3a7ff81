#pragma once

#include "video/video_capture_device.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace net {

/// Session setup sent when the channel opens
struct ChannelConfig {
    std::string model;                        ///< Remote model name
    std::string system_instruction;           ///< Prompt for the session
    std::string voice = "Kore";               ///< Prebuilt voice for audio replies
    std::string response_modality = "AUDIO";  ///< Model answers with audio
    bool input_transcription = true;          ///< Ask for transcripts of user speech
    bool output_transcription = true;         ///< Ask for transcripts of model speech
};

/// Something the remote side did. Delivered asynchronously on channel threads.
struct ChannelEvent {
    enum class Type {
        OPENED,
        OUTPUT_TRANSCRIPTION,   ///< text: delta of the model's speech transcript
        INPUT_TRANSCRIPTION,    ///< text: delta of the user's speech transcript
        TURN_COMPLETE,
        AUDIO_SEGMENT,          ///< audio: PCM16 LE bytes, sample_rate, channels
        INTERRUPTED,            ///< user barged in
        ERROR,                  ///< text: detail
        CLOSED
    };

    Type type = Type::OPENED;
    std::string text;
    std::vector<uint8_t> audio;
    int sample_rate = 0;
    int channels = 0;

    static ChannelEvent opened() { return make(Type::OPENED); }
    static ChannelEvent output_transcription(std::string t) { return make(Type::OUTPUT_TRANSCRIPTION, std::move(t)); }
    static ChannelEvent input_transcription(std::string t) { return make(Type::INPUT_TRANSCRIPTION, std::move(t)); }
    static ChannelEvent turn_complete() { return make(Type::TURN_COMPLETE); }
    static ChannelEvent interrupted() { return make(Type::INTERRUPTED); }
    static ChannelEvent error(std::string detail) { return make(Type::ERROR, std::move(detail)); }
    static ChannelEvent closed() { return make(Type::CLOSED); }
    static ChannelEvent audio_segment(std::vector<uint8_t> bytes, int sample_rate, int channels) {
        ChannelEvent e = make(Type::AUDIO_SEGMENT);
        e.audio = std::move(bytes);
        e.sample_rate = sample_rate;
        e.channels = channels;
        return e;
    }

private:
    static ChannelEvent make(Type type, std::string text = std::string()) {
        ChannelEvent e;
        e.type = type;
        e.text = std::move(text);
        return e;
    }
};

const char* to_string(ChannelEvent::Type type);

/// Receives channel events. Must not block.
using EventSink = std::function<void(ChannelEvent&& event)>;

/**
 * @brief Duplex streaming channel to the remote model
 *
 * Transport and session negotiation live behind this interface. Sends are
 * fire-and-continue: they queue data and return; failures surface later as
 * an ERROR event. send_audio/send_video may be called from different threads.
 */
class IRealtimeChannel {
public:
    virtual ~IRealtimeChannel() = default;

    /// Begin connecting. OPENED (or ERROR) arrives later through `sink`.
    /// @return false if the attempt could not even start; `error` says why
    virtual bool open(const ChannelConfig& config, EventSink sink, std::string& error) = 0;

    /// Queue a block of PCM16 LE mono audio.
    virtual bool send_audio(const uint8_t* data, size_t size, int sample_rate) = 0;

    /// Queue one encoded still.
    virtual bool send_video(const video::VideoFrame& frame) = 0;

    /// Close the session. Safe to call when closed.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace net
