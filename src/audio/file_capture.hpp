#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

// WAV-backed capture that simulates a microphone by handing out fixed-size
// mono blocks at the file's own sample rate. Decoding is done by dr_wav.
class FileCapture {
public:
    bool start_from_wav(const std::string& path);
    void stop();
    int sample_rate() const { return sample_rate_; }

    // Copy up to `max_frames` of the next mono PCM16 frames into `out`.
    // Returns frames copied, 0 at end of file.
    size_t read_chunk(int16_t* out, size_t max_frames);

    // Rewind to the first frame.
    void rewind() { cursor_ = 0; }

    // Basic file info for reporting
    int channels() const { return channels_; }
    double duration_seconds() const { return duration_seconds_; }
    std::string source_path() const { return source_path_; }

private:
    std::string source_path_;
    std::vector<int16_t> mono_; // decoded mono PCM16
    size_t cursor_ = 0;
    int sample_rate_ = 0;
    int channels_ = 0;
    double duration_seconds_ = 0.0;
};

} // namespace audio
