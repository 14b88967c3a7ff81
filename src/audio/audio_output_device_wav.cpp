#include "audio_output_device_wav.hpp"
#include "core/logging.hpp"

#include <dr_wav.h>

namespace audio {

struct AudioOutputDevice_Wav::WavSink {
    drwav wav;
};

AudioOutputDevice_Wav::AudioOutputDevice_Wav(std::string path, int block_ms)
    : AudioOutputDevice_Null(block_ms), path_(std::move(path)) {}

AudioOutputDevice_Wav::~AudioOutputDevice_Wav() {
    // Join the render thread before the sink goes away
    stop();
}

bool AudioOutputDevice_Wav::open_sink(int sample_rate) {
    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_PCM;
    format.channels = 1;
    format.sampleRate = static_cast<drwav_uint32>(sample_rate);
    format.bitsPerSample = 16;

    auto sink = std::make_unique<WavSink>();
    if (!drwav_init_file_write(&sink->wav, path_.c_str(), &format, nullptr)) {
        core::log_error("Failed to open WAV for writing: " + path_);
        return false;
    }
    sink_ = std::move(sink);
    frames_written_ = 0;
    core::log_info("Recording model audio to " + path_);
    return true;
}

void AudioOutputDevice_Wav::on_block(const int16_t* samples, size_t frames) {
    if (!sink_) return;
    frames_written_ += drwav_write_pcm_frames(&sink_->wav, frames, samples);
}

void AudioOutputDevice_Wav::close_sink() {
    if (!sink_) return;
    drwav_uninit(&sink_->wav);
    sink_.reset();
    core::log_info("WAV recording closed (" + std::to_string(frames_written_) + " frames)");
}

} // namespace audio
