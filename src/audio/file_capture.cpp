#include "audio/file_capture.hpp"
#include <algorithm>
#include <cstring>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

namespace audio {

bool FileCapture::start_from_wav(const std::string& path) {
    stop();
    source_path_.clear();
    channels_ = 0;
    duration_seconds_ = 0.0;

    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        return false;
    }

    const uint64_t n = wav.totalPCMFrameCount;
    const unsigned channels = wav.channels;
    if (n == 0 || channels == 0 || wav.sampleRate == 0) {
        drwav_uninit(&wav);
        return false;
    }

    std::vector<int16_t> pcm16(static_cast<size_t>(n) * channels);
    const uint64_t read = drwav_read_pcm_frames_s16(&wav, n, pcm16.data());
    sample_rate_ = static_cast<int>(wav.sampleRate);
    channels_ = static_cast<int>(channels);
    drwav_uninit(&wav);

    // Downmix to mono by averaging channels
    mono_.resize(static_cast<size_t>(read));
    if (channels == 1) {
        std::copy(pcm16.begin(), pcm16.begin() + static_cast<std::ptrdiff_t>(read), mono_.begin());
    } else {
        for (uint64_t i = 0; i < read; i++) {
            int32_t sum = 0;
            for (unsigned c = 0; c < channels; ++c) {
                sum += pcm16[i * channels + c];
            }
            mono_[i] = static_cast<int16_t>(sum / static_cast<int32_t>(channels));
        }
    }

    duration_seconds_ = static_cast<double>(mono_.size()) / sample_rate_;
    source_path_ = path;
    return !mono_.empty();
}

void FileCapture::stop() {
    mono_.clear();
    cursor_ = 0;
    sample_rate_ = 0;
}

size_t FileCapture::read_chunk(int16_t* out, size_t max_frames) {
    if (out == nullptr || sample_rate_ <= 0 || cursor_ >= mono_.size()) return 0;
    size_t n = std::min(max_frames, mono_.size() - cursor_);
    std::memcpy(out, mono_.data() + cursor_, n * sizeof(int16_t));
    cursor_ += n;
    return n;
}

} // namespace audio
