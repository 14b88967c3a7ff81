// Copyright (c) 2025 VAM Spatial Live
// Application API - Session Coordinator Interface
//
// Owns one live session with the remote model: streams microphone audio and
// camera frames up, turns the model's transcript into tracked objects and
// plays its audio back gap-free with barge-in support.

#pragma once

#include "core/config.hpp"
#include "vision/detection.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace audio {
class IAudioInputDevice;
class IAudioOutputDevice;
}
namespace net {
class IRealtimeChannel;
}
namespace video {
class IVideoCaptureDevice;
}

namespace app {

// Forward declarations
class SessionCoordinatorImpl;

//==============================================================================
// State and Event Structures
//==============================================================================

/// Connection lifecycle of a session
enum class ConnectionState {
    DISCONNECTED,                                 ///< Idle, nothing held
    CONNECTING,                                   ///< Devices acquired, channel opening
    CONNECTED,                                    ///< Streaming both ways
    ERROR                                         ///< Session failed and was torn down
};

const char* to_string(ConnectionState state);

/// One finished utterance in the conversation history
struct TranscriptEntry {
    enum class Role {
        USER,                                     ///< What the user said
        MODEL                                     ///< What the model said
    };

    Role role = Role::USER;
    std::string text;
};

/// Error/warning event
struct SessionError {
    /// What went wrong
    enum class Kind {
        CHANNEL_OPEN_FAILURE,                     ///< Channel could not be opened
        CHANNEL_RUNTIME_FAILURE,                  ///< Channel reported an error mid-session
        MALFORMED_DETECTION,                      ///< Unparseable box marker (logged only)
        AUDIO_DECODE_FAILURE,                     ///< Model audio segment could not be decoded
        DEVICE_ACQUISITION_FAILURE                ///< Capture/playback device unavailable
    };

    /// Error severity level
    enum class Severity {
        WARNING,                                  ///< Session continues
        ERROR                                     ///< Session torn down, state is ERROR
    };

    Kind kind = Kind::CHANNEL_RUNTIME_FAILURE;
    Severity severity = Severity::ERROR;
    std::string message;                          ///< Human-readable error message
    std::string details;                          ///< Technical details for debugging
    int64_t timestamp_ms = 0;                     ///< Milliseconds since session start
};

/// Session counters
struct SessionStats {
    ConnectionState state = ConnectionState::DISCONNECTED;
    int64_t elapsed_ms = 0;                       ///< Time since start() (0 when idle)
    uint64_t audio_bytes_sent = 0;                ///< PCM16 bytes handed to the channel
    uint64_t capture_bytes_dropped = 0;           ///< Captured bytes lost to a full uplink buffer
    uint64_t video_frames_sent = 0;               ///< Frames handed to the channel
    uint64_t segments_scheduled = 0;              ///< Model audio segments queued for playback
    uint64_t decode_failures = 0;                 ///< Model audio segments dropped
    uint64_t interruptions = 0;                   ///< Barge-ins handled
    uint64_t detections = 0;                      ///< Boxes extracted from the transcript
    uint64_t malformed_detections = 0;            ///< Box markers that failed to parse
    uint64_t events_dropped = 0;                  ///< Channel events rejected by a full queue
    size_t tracked_objects = 0;                   ///< Currently tracked objects
    size_t active_playbacks = 0;                  ///< Segments scheduled or playing
};

//==============================================================================
// Callback Types
//==============================================================================

using StateCallback = std::function<void(ConnectionState)>;
using ObjectsCallback = std::function<void(const std::vector<vision::TrackedObject>&)>;
using TranscriptCallback = std::function<void(const TranscriptEntry&)>;
using ErrorCallback = std::function<void(const SessionError&)>;

/// Where the coordinator gets its devices. Any factory left empty falls back
/// to the synthetic/null implementation. Devices and the channel are kept
/// until the next start() so callers may hold raw pointers between sessions.
struct SessionDevices {
    std::function<std::unique_ptr<net::IRealtimeChannel>()> make_channel;
    std::function<std::unique_ptr<audio::IAudioInputDevice>()> make_audio_input;
    std::function<std::unique_ptr<video::IVideoCaptureDevice>()> make_video_input;
    std::function<std::unique_ptr<audio::IAudioOutputDevice>()> make_audio_output;
};

//==============================================================================
// Main Coordinator Class
//==============================================================================

/// Runs a live spatial session
///
/// Thread Safety:
/// - All public methods are thread-safe
/// - Channel events are handled on one internal event-loop thread
/// - Callbacks are invoked from internal threads with copies of the data;
///   GUI applications should marshal them to the UI thread
/// - State and object snapshots are delivered by one thread at a time, in
///   order; a state raised while a callback runs is delivered once it returns
/// - stop() may be called from inside a callback
///
/// Example:
/// @code
/// SessionCoordinator session(devices);
/// session.subscribe_to_objects([](const std::vector<vision::TrackedObject>& objs) {
///     std::cout << objs.size() << " objects\n";
/// });
/// session.start(core::SessionConfig());
/// // ... let it run ...
/// session.stop();
/// @endcode
class SessionCoordinator {
public:
    //==========================================================================
    // Lifecycle
    //==========================================================================

    explicit SessionCoordinator(SessionDevices devices = SessionDevices());

    /// Destructor (stops the session if running)
    ~SessionCoordinator();

    // Non-copyable, non-movable
    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;
    SessionCoordinator(SessionCoordinator&&) = delete;
    SessionCoordinator& operator=(SessionCoordinator&&) = delete;

    //==========================================================================
    // Session Control
    //==========================================================================

    /// Acquire devices and open the channel
    /// @return true if the session is CONNECTING; false on failure (state is
    ///         ERROR and an error event was emitted) or if already active
    bool start(const core::SessionConfig& config);

    /// Tear the session down and return to DISCONNECTED
    /// @note Idempotent; synchronous (no session callbacks fire for this
    ///       session's channel events after it returns)
    void stop();

    ConnectionState get_state() const;
    SessionStats get_stats() const;

    /// Width / height of the opened video device (16:9 when none is open)
    double get_video_aspect_ratio() const;

    //==========================================================================
    // Snapshots
    //==========================================================================

    std::vector<vision::TrackedObject> get_tracked_objects() const;

    /// Completed transcript entries, oldest first. Kept across sessions.
    std::vector<TranscriptEntry> get_history() const;

    void clear_history();

    //==========================================================================
    // Event Subscription
    //==========================================================================

    void subscribe_to_state(StateCallback callback);
    void subscribe_to_objects(ObjectsCallback callback);
    void subscribe_to_transcript(TranscriptCallback callback);
    void subscribe_to_errors(ErrorCallback callback);

    /// Clear all event subscriptions
    void clear_subscriptions();

private:
    std::unique_ptr<SessionCoordinatorImpl> impl_;  ///< PIMPL implementation
};

} // namespace app
