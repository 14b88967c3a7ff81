#pragma once
#include "audio/pcm.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace audio {

using SourceId = uint64_t;
constexpr SourceId kInvalidSource = 0;

/**
 * @brief Playback engine with its own monotonic clock
 *
 * Sources are started at an absolute time on the engine clock. The engine
 * calls `on_ended` exactly once per source: when it plays out (stopped=false)
 * or when stop_source() removes it (stopped=true). Callbacks are invoked
 * without engine locks held, and never from inside start_source().
 */
class IPlaybackEngine {
public:
    using EndedCallback = std::function<void(SourceId id, bool stopped)>;

    virtual ~IPlaybackEngine() = default;

    /// Current engine time in seconds. Never decreases.
    virtual double current_time() const = 0;

    /// Output sample rate of the engine.
    virtual int sample_rate() const = 0;

    /// Schedule a segment to start at `start_time` (seconds, engine clock).
    /// A start time in the past plays immediately.
    /// @return Source id, or kInvalidSource if the segment cannot be played
    virtual SourceId start_source(std::shared_ptr<const AudioSegment> segment,
                                  double start_time,
                                  EndedCallback on_ended) = 0;

    /// Stop a source. No-op if it already ended or was never started.
    virtual void stop_source(SourceId id) = 0;
};

} // namespace audio
