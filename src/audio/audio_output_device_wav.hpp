#pragma once

#include "audio_output_device_null.hpp"
#include <memory>
#include <string>

namespace audio {

/**
 * @brief Paced output device that records everything it renders to a WAV file
 *
 * Mono PCM16 at the mixer rate. Useful on machines without an output device
 * and for checking that streamed segments were stitched without gaps.
 */
class AudioOutputDevice_Wav : public AudioOutputDevice_Null {
public:
    explicit AudioOutputDevice_Wav(std::string path, int block_ms = 10);
    ~AudioOutputDevice_Wav() override;

    std::string name() const override { return "WAV Recorder (" + path_ + ")"; }

    /// Frames written since start()
    uint64_t frames_written() const { return frames_written_; }

protected:
    void on_block(const int16_t* samples, size_t frames) override;
    bool open_sink(int sample_rate) override;
    void close_sink() override;

private:
    struct WavSink;     // drwav writer, defined with dr_wav in the .cpp

    std::string path_;
    std::unique_ptr<WavSink> sink_;
    uint64_t frames_written_ = 0;
};

} // namespace audio
