#pragma once
#include "audio/playback_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace audio {

/**
 * @brief Software playback engine driven by an output device
 *
 * The clock is the number of frames rendered so far divided by the sample
 * rate, so it advances only as fast as the output device pulls audio.
 * Sources are resampled to the mixer rate when scheduled and summed with
 * saturation when rendered.
 *
 * render() is called from the output device thread; start_source() and
 * stop_source() from any thread.
 */
class AudioMixer : public IPlaybackEngine {
public:
    explicit AudioMixer(int sample_rate = 24000);
    ~AudioMixer() override = default;

    double current_time() const override;
    int sample_rate() const override { return sample_rate_; }

    SourceId start_source(std::shared_ptr<const AudioSegment> segment,
                          double start_time,
                          EndedCallback on_ended) override;

    void stop_source(SourceId id) override;

    /// Mix the next `frames` mono samples into `out` and advance the clock.
    void render(int16_t* out, size_t frames);

    /// Stop every source (each gets its ended callback with stopped=true).
    void stop_all();

    size_t active_sources() const;
    uint64_t frames_rendered() const;

private:
    struct Source {
        SourceId id;
        std::shared_ptr<const std::vector<int16_t>> pcm;   // at mixer rate
        uint64_t start_frame;
        size_t cursor;
        EndedCallback on_ended;
    };

    const int sample_rate_;
    mutable std::mutex mutex_;
    std::vector<Source> sources_;
    std::vector<int32_t> mix_;
    uint64_t frames_rendered_ = 0;
    SourceId next_id_ = 1;
};

} // namespace audio
