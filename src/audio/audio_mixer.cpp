#include "audio/audio_mixer.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace audio {

AudioMixer::AudioMixer(int sample_rate)
    : sample_rate_(sample_rate > 0 ? sample_rate : 24000)
    , mix_(4096, 0) {}

double AudioMixer::current_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<double>(frames_rendered_) / static_cast<double>(sample_rate_);
}

SourceId AudioMixer::start_source(std::shared_ptr<const AudioSegment> segment,
                                  double start_time,
                                  EndedCallback on_ended) {
    if (!segment || segment->samples.empty() || segment->sample_rate <= 0) {
        return kInvalidSource;
    }

    const double start = std::max(0.0, start_time);
    const int64_t first_frame = std::llround(start * sample_rate_);

    std::shared_ptr<const std::vector<int16_t>> pcm;
    if (segment->sample_rate == sample_rate_) {
        // Share the decoded buffer; the segment is immutable from here on.
        pcm = std::shared_ptr<const std::vector<int16_t>>(segment, &segment->samples);
    } else {
        // Converted length runs up to the frame where the scheduled end falls,
        // so a segment starting at this one's end begins on the next frame
        const double duration = segment->duration_seconds > 0.0
            ? segment->duration_seconds
            : static_cast<double>(segment->samples.size()) / segment->sample_rate;
        const int64_t end_frame = std::llround((start + duration) * sample_rate_);
        if (end_frame <= first_frame) {
            return kInvalidSource;
        }
        auto converted = std::make_shared<std::vector<int16_t>>();
        resample_linear_frames(segment->samples.data(), segment->samples.size(),
                               static_cast<size_t>(end_frame - first_frame), *converted);
        if (converted->empty()) {
            return kInvalidSource;
        }
        pcm = converted;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Source src;
    src.id = next_id_++;
    src.pcm = std::move(pcm);
    src.start_frame = std::max<uint64_t>(static_cast<uint64_t>(first_frame), frames_rendered_);
    src.cursor = 0;
    src.on_ended = std::move(on_ended);
    sources_.push_back(std::move(src));
    return sources_.back().id;
}

void AudioMixer::stop_source(SourceId id) {
    EndedCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(sources_.begin(), sources_.end(),
                               [id](const Source& s) { return s.id == id; });
        if (it == sources_.end()) {
            return;
        }
        cb = std::move(it->on_ended);
        sources_.erase(it);
    }
    if (cb) cb(id, true);
}

void AudioMixer::stop_all() {
    std::vector<Source> stopped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped.swap(sources_);
    }
    for (auto& s : stopped) {
        if (s.on_ended) s.on_ended(s.id, true);
    }
}

void AudioMixer::render(int16_t* out, size_t frames) {
    if (out == nullptr || frames == 0) return;

    std::vector<Source> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (mix_.size() < frames) {
            mix_.resize(frames);
        }
        std::fill(mix_.begin(), mix_.begin() + frames, 0);

        const uint64_t block_start = frames_rendered_;
        const uint64_t block_end = block_start + frames;

        for (auto& s : sources_) {
            if (s.start_frame >= block_end) continue;
            const size_t offset = s.start_frame > block_start
                ? static_cast<size_t>(s.start_frame - block_start) : 0;
            const size_t n = std::min(frames - offset, s.pcm->size() - s.cursor);
            const int16_t* src = s.pcm->data() + s.cursor;
            for (size_t j = 0; j < n; ++j) {
                mix_[offset + j] += src[j];
            }
            s.cursor += n;
        }

        for (size_t i = 0; i < frames; ++i) {
            out[i] = static_cast<int16_t>(std::clamp(mix_[i], -32768, 32767));
        }
        frames_rendered_ = block_end;

        auto done = std::stable_partition(sources_.begin(), sources_.end(),
                                          [](const Source& s) { return s.cursor < s.pcm->size(); });
        std::move(done, sources_.end(), std::back_inserter(finished));
        sources_.erase(done, sources_.end());
    }

    for (auto& s : finished) {
        if (s.on_ended) s.on_ended(s.id, false);
    }
}

size_t AudioMixer::active_sources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_.size();
}

uint64_t AudioMixer::frames_rendered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_rendered_;
}

} // namespace audio
