#pragma once
#include "audio/pcm.hpp"
#include "audio/playback_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace audio {

/// Opaque handle of a scheduled segment.
using PlaybackHandle = uint64_t;
constexpr PlaybackHandle kInvalidPlayback = 0;

/// Where a segment landed on the engine clock
struct ScheduledPlayback {
    PlaybackHandle handle = kInvalidPlayback;
    double start_time = 0.0;
    double duration = 0.0;
};

/**
 * @brief Gapless scheduling of streamed model audio with barge-in
 *
 * Keeps a cursor (`next_start_time`) on the engine clock. Each segment starts
 * at max(cursor, now) and moves the cursor to the end of that segment, so
 * back-to-back segments abut exactly whether they arrive early or late.
 *
 * Active segments live in a registry keyed by handle. Natural completion and
 * cancellation both go through the registry. interrupt() stops everything and
 * resets the cursor, so the next segment plays immediately.
 *
 * Thread-safe: schedule()/interrupt() come from the event loop, completion
 * notifications from the engine thread.
 */
class PlaybackScheduler {
public:
    explicit PlaybackScheduler(IPlaybackEngine& engine);
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    /// Schedule a decoded segment. Invalid or empty segments are rejected
    /// (returned handle is kInvalidPlayback) and the cursor does not move.
    ScheduledPlayback schedule(AudioSegment segment);

    /// Barge-in: stop all active segments and reset the cursor.
    /// @return Number of segments that were stopped
    size_t interrupt();

    /// Teardown: same effect as interrupt().
    size_t stop_all() { return interrupt(); }

    size_t active_count() const;
    double next_start_time() const;
    bool is_active(PlaybackHandle handle) const;

    size_t scheduled_count() const;
    size_t interrupted_count() const;

private:
    void on_source_ended(PlaybackHandle handle, bool stopped);

    IPlaybackEngine& engine_;
    mutable std::mutex mutex_;
    std::unordered_map<PlaybackHandle, SourceId> active_;
    double next_start_time_ = 0.0;
    PlaybackHandle next_handle_ = 1;
    size_t scheduled_count_ = 0;
    size_t interrupted_count_ = 0;
};

} // namespace audio
