#include "audio/playback_scheduler.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <memory>
#include <vector>

namespace audio {

PlaybackScheduler::PlaybackScheduler(IPlaybackEngine& engine) : engine_(engine) {}

PlaybackScheduler::~PlaybackScheduler() {
    stop_all();
}

ScheduledPlayback PlaybackScheduler::schedule(AudioSegment segment) {
    ScheduledPlayback result;
    if (segment.samples.empty() || segment.sample_rate <= 0 || segment.duration_seconds <= 0.0) {
        core::log_warn("PlaybackScheduler: dropping empty or invalid segment");
        return result;
    }

    auto shared = std::make_shared<const AudioSegment>(std::move(segment));

    // Held across start_source so a completion racing in from the engine
    // thread always finds the handle registered.
    std::lock_guard<std::mutex> lock(mutex_);
    const double start = std::max(next_start_time_, engine_.current_time());
    const PlaybackHandle handle = next_handle_++;

    SourceId source = engine_.start_source(
        shared, start,
        [this, handle](SourceId, bool stopped) { on_source_ended(handle, stopped); });
    if (source == kInvalidSource) {
        core::log_warn("PlaybackScheduler: engine rejected segment");
        return result;
    }

    active_[handle] = source;
    next_start_time_ = start + shared->duration_seconds;
    scheduled_count_++;

    result.handle = handle;
    result.start_time = start;
    result.duration = shared->duration_seconds;
    return result;
}

size_t PlaybackScheduler::interrupt() {
    std::vector<SourceId> to_stop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_stop.reserve(active_.size());
        for (const auto& kv : active_) {
            to_stop.push_back(kv.second);
        }
        active_.clear();
        next_start_time_ = 0.0;
        interrupted_count_ += to_stop.size();
    }

    // Outside the lock: the engine reports stops through on_source_ended.
    for (SourceId id : to_stop) {
        engine_.stop_source(id);
    }
    if (!to_stop.empty()) {
        core::log_debug("PlaybackScheduler: stopped " + std::to_string(to_stop.size()) + " segment(s)");
    }
    return to_stop.size();
}

void PlaybackScheduler::on_source_ended(PlaybackHandle handle, bool) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(handle);
}

size_t PlaybackScheduler::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

double PlaybackScheduler::next_start_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_start_time_;
}

bool PlaybackScheduler::is_active(PlaybackHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(handle) != 0;
}

size_t PlaybackScheduler::scheduled_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scheduled_count_;
}

size_t PlaybackScheduler::interrupted_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interrupted_count_;
}

} // namespace audio
