// Copyright (c) 2025 VAM Spatial Live
// Application API - Session Coordinator Implementation

#include "app/session_coordinator.hpp"

#include "audio/audio_input_device.hpp"
#include "audio/audio_input_device_synthetic.hpp"
#include "audio/audio_mixer.hpp"
#include "audio/audio_output_device.hpp"
#include "audio/audio_output_device_null.hpp"
#include "audio/capture_resampler.hpp"
#include "audio/pcm.hpp"
#include "audio/playback_scheduler.hpp"
#include "core/clock.hpp"
#include "core/event_queue.hpp"
#include "core/logging.hpp"
#include "core/periodic_timer.hpp"
#include "core/ring_buffer.hpp"
#include "net/realtime_channel.hpp"
#include "video/video_capture_device.hpp"
#include "vision/detection_parser.hpp"
#include "vision/identity_tracker.hpp"

#include <algorithm>
#include <atomic>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>

namespace app {

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::CONNECTED: return "CONNECTED";
        case ConnectionState::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

namespace {

constexpr size_t kUplinkChunkBytes = 8192;
constexpr int kUplinkBufferSeconds = 2;
constexpr double kDefaultAspectRatio = 16.0 / 9.0;

/// Work item for the event loop, tagged with the session that produced it
struct QueuedEvent {
    enum class Origin {
        CHANNEL,        ///< Event from the realtime channel
        AUDIO_DEVICE,   ///< Fatal capture device error (event.text = detail)
        PRUNE_TICK      ///< Periodic tracker sweep
    };

    uint64_t generation = 0;
    Origin origin = Origin::CHANNEL;
    net::ChannelEvent event;
};

using EventQueuePtr = std::shared_ptr<core::EventQueue<QueuedEvent>>;

/// Callbacks collected under the session lock, emitted after it is released.
/// State and object snapshots carry a sequence number so a snapshot that lost
/// the race to a newer one is never delivered after it.
struct Notifications {
    std::vector<TranscriptEntry> transcript;
    std::vector<SessionError> errors;
    std::vector<std::pair<ConnectionState, uint64_t>> states;
    bool objects_changed = false;
    uint64_t objects_seq = 0;
    std::vector<vision::TrackedObject> objects;
};

} // namespace

//==============================================================================
// Implementation Class (PIMPL Pattern)
//==============================================================================

class SessionCoordinatorImpl {
public:
    explicit SessionCoordinatorImpl(SessionDevices devices);
    ~SessionCoordinatorImpl();

    // Session Control
    bool start(const core::SessionConfig& config);
    void stop();
    ConnectionState get_state() const { return state_.load(); }
    SessionStats get_stats() const;
    double get_video_aspect_ratio() const { return aspect_ratio_.load(); }

    // Snapshots
    std::vector<vision::TrackedObject> get_tracked_objects() const;
    std::vector<TranscriptEntry> get_history() const;
    void clear_history();

    // Event Subscription
    void subscribe_to_state(StateCallback callback);
    void subscribe_to_objects(ObjectsCallback callback);
    void subscribe_to_transcript(TranscriptCallback callback);
    void subscribe_to_errors(ErrorCallback callback);
    void clear_subscriptions();

private:
    // Lifecycle (session_mutex_ held)
    bool acquire_devices_locked(const EventQueuePtr& queue, uint64_t generation, Notifications& n);
    bool open_channel_locked(const EventQueuePtr& queue, uint64_t generation, Notifications& n);
    void teardown_locked(ConnectionState final_state, Notifications& n);
    void fail_locked(SessionError::Kind kind, const std::string& message,
                     const std::string& details, Notifications& n);
    void set_state_locked(ConnectionState state, Notifications& n);

    // Event loop (session_mutex_ held by the handlers)
    void event_loop(EventQueuePtr queue);
    void handle_event_locked(QueuedEvent& queued, Notifications& n);
    void on_opened_locked(Notifications& n);
    void on_output_transcription_locked(const std::string& text, Notifications& n);
    void on_turn_complete_locked(Notifications& n);
    void on_audio_segment_locked(const net::ChannelEvent& event, Notifications& n);
    void on_prune_locked(Notifications& n);

    // Device and timer threads
    void on_captured_audio(const int16_t* samples, size_t count);
    void pump_uplink();
    void send_frame();

    void reap_threads();
    std::shared_ptr<vision::IdentityTracker> tracker() const;
    int64_t get_elapsed_ms() const;
    SessionError make_error(SessionError::Kind kind, SessionError::Severity severity,
                            const std::string& message, const std::string& details) const;

    // Emission (no locks held)
    void emit(const Notifications& n);
    void emit_state(ConnectionState state, uint64_t seq);
    void emit_objects(const std::vector<vision::TrackedObject>& objects, uint64_t seq);
    void mark_objects_changed_locked(Notifications& n);
    void emit_transcript(const TranscriptEntry& entry);
    void emit_error(const SessionError& error);

    SessionDevices devices_;
    core::SessionConfig config_;

    // Session state
    mutable std::mutex session_mutex_;
    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};
    std::atomic<uint64_t> generation_{0};
    std::atomic<int64_t> session_start_ms_{0};
    bool session_active_ = false;

    // Devices (replaced only by start())
    std::unique_ptr<net::IRealtimeChannel> channel_;
    std::unique_ptr<audio::IAudioInputDevice> audio_input_;
    std::unique_ptr<video::IVideoCaptureDevice> video_input_;
    std::unique_ptr<audio::IAudioOutputDevice> audio_output_;
    std::atomic<double> aspect_ratio_{kDefaultAspectRatio};

    // Uplink
    std::unique_ptr<audio::CaptureResampler> resampler_;
    std::unique_ptr<core::SpscRingBuffer<uint8_t>> uplink_ring_;
    std::vector<uint8_t> uplink_chunk_;
    std::atomic<bool> overflow_warned_{false};

    // Playback (scheduler is destroyed before the mixer it references)
    std::unique_ptr<audio::AudioMixer> mixer_;
    std::unique_ptr<audio::PlaybackScheduler> scheduler_;

    // Vision
    vision::DetectionParser parser_;
    std::shared_ptr<vision::IdentityTracker> tracker_;

    // Transcript accumulation for the current turn
    std::string user_text_;
    std::string model_text_;

    mutable std::mutex history_mutex_;
    std::vector<TranscriptEntry> history_;

    // Threading
    EventQueuePtr queue_;
    std::mutex threads_mutex_;
    std::unique_ptr<std::thread> loop_thread_;
    std::vector<std::unique_ptr<std::thread>> retired_threads_;
    core::PeriodicTimer uplink_timer_{"uplink"};
    core::PeriodicTimer frame_timer_{"frames"};
    core::PeriodicTimer prune_timer_{"prune"};

    // Snapshot ordering (state_seq_/objects_seq_ under session_mutex_).
    // One thread at a time delivers states and objects; others hand their
    // snapshot over through the pending slots and return without waiting.
    uint64_t state_seq_ = 0;
    uint64_t objects_seq_ = 0;
    std::mutex emit_mutex_;
    std::deque<ConnectionState> pending_states_;
    uint64_t last_state_queued_ = 0;
    bool delivering_states_ = false;
    std::vector<vision::TrackedObject> pending_objects_;
    bool has_pending_objects_ = false;
    uint64_t last_objects_queued_ = 0;
    bool delivering_objects_ = false;

    // Callbacks
    mutable std::mutex callbacks_mutex_;
    std::vector<StateCallback> state_callbacks_;
    std::vector<ObjectsCallback> objects_callbacks_;
    std::vector<TranscriptCallback> transcript_callbacks_;
    std::vector<ErrorCallback> error_callbacks_;

    // Statistics
    std::atomic<uint64_t> audio_bytes_sent_{0};
    std::atomic<uint64_t> video_frames_sent_{0};
    std::atomic<uint64_t> segments_scheduled_{0};
    std::atomic<uint64_t> decode_failures_{0};
    std::atomic<uint64_t> interruptions_{0};
    std::atomic<uint64_t> detections_{0};
    std::atomic<uint64_t> malformed_detections_{0};
    std::atomic<uint64_t> capture_dropped_base_{0};
};

SessionCoordinatorImpl::SessionCoordinatorImpl(SessionDevices devices)
    : devices_(std::move(devices))
    , tracker_(std::make_shared<vision::IdentityTracker>()) {}

SessionCoordinatorImpl::~SessionCoordinatorImpl() {
    stop();
    // Devices go before the playback graph they render
    std::lock_guard<std::mutex> lock(session_mutex_);
    audio_output_.reset();
    scheduler_.reset();
    mixer_.reset();
}

//==============================================================================
// Session Control Implementation
//==============================================================================

bool SessionCoordinatorImpl::start(const core::SessionConfig& config) {
    // A loop thread left behind by an error teardown is joined here
    reap_threads();

    Notifications n;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);

        if (session_active_) {
            core::log_error("[Session] Session already active");
            return false;
        }

        config_ = config;

        // Reap timer threads cancelled from inside their own tick
        uplink_timer_.stop();
        frame_timer_.stop();
        prune_timer_.stop();

        // Reset per-session state
        audio_bytes_sent_ = 0;
        video_frames_sent_ = 0;
        segments_scheduled_ = 0;
        decode_failures_ = 0;
        interruptions_ = 0;
        detections_ = 0;
        malformed_detections_ = 0;
        overflow_warned_ = false;
        user_text_.clear();
        model_text_.clear();
        parser_ = vision::DetectionParser(config.parser_buffer_chars);

        vision::TrackerConfig tracker_config;
        tracker_config.match_distance = config.match_distance;
        tracker_config.ttl_ms = config.object_ttl_ms;
        std::atomic_store(&tracker_, std::make_shared<vision::IdentityTracker>(tracker_config));

        const uint64_t generation = ++generation_;
        session_active_ = true;
        session_start_ms_ = core::now_ms();
        queue_ = std::make_shared<core::EventQueue<QueuedEvent>>(config.event_queue_capacity);
        EventQueuePtr queue = queue_;

        core::log_info("[Session] Starting session with model " + config.model);
        set_state_locked(ConnectionState::CONNECTING, n);

        if (acquire_devices_locked(queue, generation, n)) {
            {
                std::lock_guard<std::mutex> threads_lock(threads_mutex_);
                loop_thread_ = std::make_unique<std::thread>(&SessionCoordinatorImpl::event_loop, this, queue);
            }

            bool timer_ok = prune_timer_.start(std::chrono::milliseconds(config.prune_interval_ms), [queue, generation]() {
                QueuedEvent tick;
                tick.generation = generation;
                tick.origin = QueuedEvent::Origin::PRUNE_TICK;
                if (!queue->push(std::move(tick)) && !queue->is_stopped()) {
                    core::log_debug("[Session] Event queue full, skipping prune sweep");
                }
            });

            if (!timer_ok) {
                fail_locked(SessionError::Kind::DEVICE_ACQUISITION_FAILURE, "Could not start prune timer",
                            "prune_interval_ms=" + std::to_string(config.prune_interval_ms), n);
            } else {
                ok = open_channel_locked(queue, generation, n);
            }
        }
    }

    if (!ok) {
        reap_threads();
    }
    emit(n);
    return ok;
}

void SessionCoordinatorImpl::stop() {
    Notifications n;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        teardown_locked(ConnectionState::DISCONNECTED, n);
    }
    reap_threads();
    emit(n);
}

bool SessionCoordinatorImpl::acquire_devices_locked(const EventQueuePtr& queue, uint64_t generation, Notifications& n) {
    // Previous session's devices are all stopped; drop them now
    channel_.reset();
    audio_input_.reset();
    video_input_.reset();
    audio_output_.reset();
    scheduler_.reset();
    mixer_.reset();

    mixer_ = std::make_unique<audio::AudioMixer>(config_.output_sample_rate);
    scheduler_ = std::make_unique<audio::PlaybackScheduler>(*mixer_);

    channel_ = devices_.make_channel ? devices_.make_channel() : nullptr;
    if (!channel_) {
        fail_locked(SessionError::Kind::CHANNEL_OPEN_FAILURE, "No realtime channel available", "", n);
        return false;
    }

    // Camera
    video_input_ = devices_.make_video_input ? devices_.make_video_input()
                                             : std::make_unique<video::VideoDevice_Synthetic>();
    video::VideoCaptureConfig video_config;
    video_config.width = config_.video_width;
    video_config.height = config_.video_height;
    video_config.fps = config_.video_fps;
    if (!video_input_ || !video_input_->open(video_config)) {
        fail_locked(SessionError::Kind::DEVICE_ACQUISITION_FAILURE, "Camera unavailable",
                    std::to_string(config_.video_width) + "x" + std::to_string(config_.video_height), n);
        return false;
    }
    aspect_ratio_ = video_input_->aspect_ratio();

    // Microphone
    audio_input_ = devices_.make_audio_input ? devices_.make_audio_input()
                                             : std::make_unique<audio::AudioInputDevice_Synthetic>();
    audio::AudioInputConfig input_config;
    input_config.device_id = config_.audio_input;
    input_config.frame_samples = config_.capture_frame_samples;

    auto on_audio = [this](const int16_t* samples, size_t count, int /*sample_rate*/, int /*channels*/) {
        on_captured_audio(samples, count);
    };
    auto on_device_error = [queue, generation](const std::string& message, bool is_fatal) {
        if (!is_fatal) {
            core::log_warn("[Session] Capture device: " + message);
            return;
        }
        QueuedEvent failure;
        failure.generation = generation;
        failure.origin = QueuedEvent::Origin::AUDIO_DEVICE;
        failure.event = net::ChannelEvent::error(message);
        if (!queue->push(std::move(failure)) && !queue->is_stopped()) {
            core::log_error("[Session] Event queue full, lost capture device failure: " + message);
        }
    };

    if (!audio_input_ || !audio_input_->initialize(input_config, on_audio, on_device_error)) {
        fail_locked(SessionError::Kind::DEVICE_ACQUISITION_FAILURE, "Microphone unavailable", config_.audio_input, n);
        return false;
    }

    const int native_rate = audio_input_->get_actual_config().sample_rate;
    resampler_ = std::make_unique<audio::CaptureResampler>(
        native_rate, config_.capture_target_rate, static_cast<size_t>(config_.capture_frame_samples));
    uplink_ring_ = std::make_unique<core::SpscRingBuffer<uint8_t>>(
        static_cast<size_t>(config_.capture_target_rate) * 2 * kUplinkBufferSeconds);
    uplink_chunk_.assign(kUplinkChunkBytes, 0);

    core::log_info("[Session] Microphone: " + audio_input_->get_device_info().name + " @ " +
                   std::to_string(native_rate) + " Hz -> " + std::to_string(config_.capture_target_rate) + " Hz");

    // Speaker
    audio_output_ = devices_.make_audio_output ? devices_.make_audio_output()
                                               : std::make_unique<audio::AudioOutputDevice_Null>();
    audio::AudioMixer* mixer = mixer_.get();
    if (!audio_output_ || !audio_output_->start(mixer->sample_rate(), [mixer](int16_t* out, size_t frames) {
            mixer->render(out, frames);
        })) {
        fail_locked(SessionError::Kind::DEVICE_ACQUISITION_FAILURE, "Audio output unavailable",
                    std::to_string(mixer->sample_rate()) + " Hz", n);
        return false;
    }

    return true;
}

bool SessionCoordinatorImpl::open_channel_locked(const EventQueuePtr& queue, uint64_t generation, Notifications& n) {
    net::ChannelConfig channel_config;
    channel_config.model = config_.model;
    channel_config.system_instruction = config_.system_instruction;
    channel_config.voice = config_.voice;

    net::EventSink sink = [queue, generation](net::ChannelEvent&& event) {
        QueuedEvent queued;
        queued.generation = generation;
        queued.origin = QueuedEvent::Origin::CHANNEL;
        queued.event = std::move(event);
        if (!queue->push(std::move(queued)) && !queue->is_stopped()) {
            core::log_warn("[Session] Event queue full, dropping channel event");
        }
    };

    std::string error;
    if (!channel_->open(channel_config, std::move(sink), error)) {
        fail_locked(SessionError::Kind::CHANNEL_OPEN_FAILURE, "Could not open realtime channel", error, n);
        return false;
    }
    return true;
}

void SessionCoordinatorImpl::teardown_locked(ConnectionState final_state, Notifications& n) {
    if (session_active_) {
        session_active_ = false;
        ++generation_;

        // Nothing queued or in flight for this session is handled after this
        if (queue_) {
            queue_->stop();
        }

        uplink_timer_.stop();
        frame_timer_.stop();
        prune_timer_.stop();

        if (audio_input_) {
            audio_input_->stop();
        }
        if (video_input_ && video_input_->is_open()) {
            video_input_->close();
        }
        if (scheduler_) {
            size_t stopped = scheduler_->stop_all();
            if (stopped > 0) {
                core::log_debug("[Session] Stopped " + std::to_string(stopped) + " playback(s)");
            }
        }
        if (audio_output_) {
            audio_output_->stop();
        }
        if (channel_) {
            channel_->close();
        }

        auto objects = tracker();
        if (objects->size() > 0) {
            objects->clear();
            mark_objects_changed_locked(n);
        }

        parser_.reset();
        user_text_.clear();
        model_text_.clear();
        session_start_ms_ = 0;
        aspect_ratio_ = kDefaultAspectRatio;

        core::log_info("[Session] Session torn down");
    }

    set_state_locked(final_state, n);
}

void SessionCoordinatorImpl::fail_locked(SessionError::Kind kind, const std::string& message,
                                         const std::string& details, Notifications& n) {
    core::log_error("[Session] " + message + (details.empty() ? "" : ": " + details));
    n.errors.push_back(make_error(kind, SessionError::Severity::ERROR, message, details));
    teardown_locked(ConnectionState::ERROR, n);
}

void SessionCoordinatorImpl::set_state_locked(ConnectionState state, Notifications& n) {
    ConnectionState previous = state_.exchange(state);
    if (previous == state) {
        return;
    }
    core::log_info(std::string("[Session] State: ") + to_string(previous) + " -> " + to_string(state));
    n.states.emplace_back(state, ++state_seq_);
}

void SessionCoordinatorImpl::reap_threads() {
    std::vector<std::unique_ptr<std::thread>> to_join;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        if (loop_thread_) {
            retired_threads_.push_back(std::move(loop_thread_));
        }
        auto self = std::this_thread::get_id();
        for (auto& thread : retired_threads_) {
            if (thread && thread->get_id() != self) {
                to_join.push_back(std::move(thread));
            }
        }
        retired_threads_.erase(std::remove(retired_threads_.begin(), retired_threads_.end(), nullptr),
                               retired_threads_.end());
    }
    for (auto& thread : to_join) {
        if (thread->joinable()) {
            thread->join();
        }
    }
}

//==============================================================================
// Event Loop
//==============================================================================

void SessionCoordinatorImpl::event_loop(EventQueuePtr queue) {
    QueuedEvent queued;
    while (queue->pop(queued)) {
        Notifications n;
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            if (!session_active_ || queued.generation != generation_.load()) {
                continue;  // stale: belongs to a session already torn down
            }
            handle_event_locked(queued, n);
        }
        emit(n);
    }
}

void SessionCoordinatorImpl::handle_event_locked(QueuedEvent& queued, Notifications& n) {
    switch (queued.origin) {
        case QueuedEvent::Origin::PRUNE_TICK:
            on_prune_locked(n);
            return;
        case QueuedEvent::Origin::AUDIO_DEVICE:
            fail_locked(SessionError::Kind::DEVICE_ACQUISITION_FAILURE, "Microphone failed", queued.event.text, n);
            return;
        case QueuedEvent::Origin::CHANNEL:
            break;
    }

    net::ChannelEvent& event = queued.event;
    core::log_debug(std::string("[Session] Event: ") + net::to_string(event.type));

    switch (event.type) {
        case net::ChannelEvent::Type::OPENED:
            on_opened_locked(n);
            break;
        case net::ChannelEvent::Type::OUTPUT_TRANSCRIPTION:
            on_output_transcription_locked(event.text, n);
            break;
        case net::ChannelEvent::Type::INPUT_TRANSCRIPTION:
            user_text_ += event.text;
            break;
        case net::ChannelEvent::Type::TURN_COMPLETE:
            on_turn_complete_locked(n);
            break;
        case net::ChannelEvent::Type::AUDIO_SEGMENT:
            on_audio_segment_locked(event, n);
            break;
        case net::ChannelEvent::Type::INTERRUPTED: {
            size_t stopped = scheduler_->interrupt();
            ++interruptions_;
            core::log_info("[Session] Interrupted, stopped " + std::to_string(stopped) + " playback(s)");
            break;
        }
        case net::ChannelEvent::Type::ERROR:
            fail_locked(SessionError::Kind::CHANNEL_RUNTIME_FAILURE, "Realtime channel error", event.text, n);
            break;
        case net::ChannelEvent::Type::CLOSED:
            core::log_info("[Session] Channel closed by remote");
            teardown_locked(ConnectionState::DISCONNECTED, n);
            break;
    }
}

void SessionCoordinatorImpl::on_opened_locked(Notifications& n) {
    if (state_ != ConnectionState::CONNECTING) {
        core::log_debug("[Session] Ignoring duplicate open");
        return;
    }
    set_state_locked(ConnectionState::CONNECTED, n);

    if (!audio_input_->start()) {
        fail_locked(SessionError::Kind::DEVICE_ACQUISITION_FAILURE, "Microphone could not start",
                    audio_input_->get_device_info().name, n);
        return;
    }

    bool uplink_ok = uplink_timer_.start(std::chrono::milliseconds(config_.uplink_interval_ms), [this]() {
        pump_uplink();
    });
    bool frames_ok = frame_timer_.start(std::chrono::milliseconds(config_.frame_interval_ms), [this]() {
        send_frame();
    });
    if (!uplink_ok || !frames_ok) {
        fail_locked(SessionError::Kind::DEVICE_ACQUISITION_FAILURE, "Could not start capture timers",
                    "uplink_interval_ms=" + std::to_string(config_.uplink_interval_ms) +
                    " frame_interval_ms=" + std::to_string(config_.frame_interval_ms), n);
    }
}

void SessionCoordinatorImpl::on_output_transcription_locked(const std::string& text, Notifications& n) {
    model_text_ += text;

    const int64_t now = core::now_ms();
    const size_t malformed_before = parser_.malformed_count();
    std::vector<vision::Detection> detections = parser_.feed(text, now);

    const size_t malformed = parser_.malformed_count() - malformed_before;
    if (malformed > 0) {
        malformed_detections_ += malformed;
        core::log_debug("[Session] Skipped " + std::to_string(malformed) + " malformed box marker(s)");
    }
    if (detections.empty()) {
        return;
    }

    detections_ += detections.size();
    auto objects = tracker();
    size_t created = objects->update(detections, now);
    if (created > 0) {
        core::log_debug("[Session] " + std::to_string(created) + " new object(s), tracking " +
                        std::to_string(objects->size()));
    }
    mark_objects_changed_locked(n);
}

void SessionCoordinatorImpl::on_turn_complete_locked(Notifications& n) {
    std::vector<TranscriptEntry> entries;
    if (!user_text_.empty()) {
        entries.push_back(TranscriptEntry{TranscriptEntry::Role::USER, user_text_});
    }
    if (!model_text_.empty()) {
        entries.push_back(TranscriptEntry{TranscriptEntry::Role::MODEL, model_text_});
    }
    user_text_.clear();
    model_text_.clear();

    if (entries.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.insert(history_.end(), entries.begin(), entries.end());
    }
    n.transcript.insert(n.transcript.end(), entries.begin(), entries.end());
}

void SessionCoordinatorImpl::on_audio_segment_locked(const net::ChannelEvent& event, Notifications& n) {
    const int rate = event.sample_rate > 0 ? event.sample_rate : config_.model_audio_rate;
    const int channels = event.channels > 0 ? event.channels : 1;

    audio::AudioSegment segment;
    std::string error;
    if (!audio::decode_pcm16le(event.audio.data(), event.audio.size(), rate, channels, segment, error)) {
        ++decode_failures_;
        core::log_warn("[Session] Dropping model audio: " + error);
        n.errors.push_back(make_error(SessionError::Kind::AUDIO_DECODE_FAILURE, SessionError::Severity::WARNING,
                                      "Could not decode model audio", error));
        return;
    }

    audio::ScheduledPlayback playback = scheduler_->schedule(std::move(segment));
    if (playback.handle == audio::kInvalidPlayback) {
        core::log_warn("[Session] Playback engine rejected model audio");
        return;
    }
    ++segments_scheduled_;
    core::log_debug("[Session] Audio segment at t=" + std::to_string(playback.start_time) +
                    "s for " + std::to_string(playback.duration) + "s");
}

void SessionCoordinatorImpl::on_prune_locked(Notifications& n) {
    auto objects = tracker();
    size_t removed = objects->prune(core::now_ms());
    if (removed == 0) {
        return;
    }
    core::log_debug("[Session] Pruned " + std::to_string(removed) + " stale object(s)");
    mark_objects_changed_locked(n);
}

void SessionCoordinatorImpl::mark_objects_changed_locked(Notifications& n) {
    n.objects_changed = true;
    n.objects_seq = ++objects_seq_;
    n.objects = tracker()->snapshot();
}

//==============================================================================
// Device and Timer Threads
//==============================================================================

void SessionCoordinatorImpl::on_captured_audio(const int16_t* samples, size_t count) {
    // Capture thread: no locks, no allocation after the first block
    size_t bytes = resampler_->process(samples, count);
    if (bytes == 0) {
        return;
    }
    if (!uplink_ring_->try_push(resampler_->data(), bytes) && !overflow_warned_.exchange(true)) {
        core::log_warn("[Session] Uplink buffer full, dropping captured audio");
    }
}

void SessionCoordinatorImpl::pump_uplink() {
    // Whole samples only
    size_t available = uplink_ring_->size() & ~static_cast<size_t>(1);
    while (available > 0) {
        size_t chunk = std::min(available, uplink_chunk_.size());
        size_t got = uplink_ring_->pop(uplink_chunk_.data(), chunk);
        if (got == 0) {
            break;
        }
        if (channel_->send_audio(uplink_chunk_.data(), got, config_.capture_target_rate)) {
            audio_bytes_sent_ += got;
        }
        available -= got;
    }
}

void SessionCoordinatorImpl::send_frame() {
    video::VideoFrame frame;
    if (!video_input_->grab(frame)) {
        core::log_debug("[Session] Frame grab failed");
        return;
    }
    if (channel_->send_video(frame)) {
        ++video_frames_sent_;
    }
}

//==============================================================================
// Snapshots and Statistics
//==============================================================================

std::shared_ptr<vision::IdentityTracker> SessionCoordinatorImpl::tracker() const {
    return std::atomic_load(&tracker_);
}

std::vector<vision::TrackedObject> SessionCoordinatorImpl::get_tracked_objects() const {
    return tracker()->snapshot();
}

std::vector<TranscriptEntry> SessionCoordinatorImpl::get_history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_;
}

void SessionCoordinatorImpl::clear_history() {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.clear();
}

SessionStats SessionCoordinatorImpl::get_stats() const {
    SessionStats stats;
    stats.state = state_.load();
    stats.elapsed_ms = get_elapsed_ms();
    stats.audio_bytes_sent = audio_bytes_sent_.load();
    stats.video_frames_sent = video_frames_sent_.load();
    stats.segments_scheduled = segments_scheduled_.load();
    stats.decode_failures = decode_failures_.load();
    stats.interruptions = interruptions_.load();
    stats.detections = detections_.load();
    stats.malformed_detections = malformed_detections_.load();
    stats.tracked_objects = tracker()->size();

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (uplink_ring_) {
        stats.capture_bytes_dropped = uplink_ring_->dropped_count();
    }
    if (queue_) {
        stats.events_dropped = queue_->dropped_count();
    }
    if (scheduler_) {
        stats.active_playbacks = scheduler_->active_count();
    }
    return stats;
}

int64_t SessionCoordinatorImpl::get_elapsed_ms() const {
    int64_t start = session_start_ms_.load();
    if (start == 0) {
        return 0;
    }
    return core::now_ms() - start;
}

SessionError SessionCoordinatorImpl::make_error(SessionError::Kind kind, SessionError::Severity severity,
                                                const std::string& message, const std::string& details) const {
    SessionError error;
    error.kind = kind;
    error.severity = severity;
    error.message = message;
    error.details = details;
    error.timestamp_ms = get_elapsed_ms();
    return error;
}

//==============================================================================
// Event Subscription
//==============================================================================

void SessionCoordinatorImpl::subscribe_to_state(StateCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    state_callbacks_.push_back(std::move(callback));
}

void SessionCoordinatorImpl::subscribe_to_objects(ObjectsCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    objects_callbacks_.push_back(std::move(callback));
}

void SessionCoordinatorImpl::subscribe_to_transcript(TranscriptCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    transcript_callbacks_.push_back(std::move(callback));
}

void SessionCoordinatorImpl::subscribe_to_errors(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    error_callbacks_.push_back(std::move(callback));
}

void SessionCoordinatorImpl::clear_subscriptions() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    state_callbacks_.clear();
    objects_callbacks_.clear();
    transcript_callbacks_.clear();
    error_callbacks_.clear();
}

//==============================================================================
// Event Emission
//==============================================================================

void SessionCoordinatorImpl::emit(const Notifications& n) {
    for (const auto& entry : n.transcript) {
        emit_transcript(entry);
    }
    if (n.objects_changed) {
        emit_objects(n.objects, n.objects_seq);
    }
    for (const auto& error : n.errors) {
        emit_error(error);
    }
    for (const auto& state : n.states) {
        emit_state(state.first, state.second);
    }
}

void SessionCoordinatorImpl::emit_state(ConnectionState state, uint64_t seq) {
    {
        std::lock_guard<std::mutex> lock(emit_mutex_);
        if (seq <= last_state_queued_) {
            return;  // a newer state is already queued or delivered
        }
        last_state_queued_ = seq;
        pending_states_.push_back(state);
        if (delivering_states_) {
            return;
        }
        delivering_states_ = true;
    }

    // No lock is held while callbacks run: a callback may call stop(),
    // which joins the loop thread that may be emitting at the same time
    for (;;) {
        ConnectionState next;
        {
            std::lock_guard<std::mutex> lock(emit_mutex_);
            if (pending_states_.empty()) {
                delivering_states_ = false;
                return;
            }
            next = pending_states_.front();
            pending_states_.pop_front();
        }

        std::vector<StateCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callbacks = state_callbacks_;
        }
        for (const auto& callback : callbacks) {
            try {
                callback(next);
            } catch (const std::exception& e) {
                core::log_error(std::string("State callback exception: ") + e.what());
            }
        }
    }
}

void SessionCoordinatorImpl::emit_objects(const std::vector<vision::TrackedObject>& objects, uint64_t seq) {
    {
        std::lock_guard<std::mutex> lock(emit_mutex_);
        if (seq <= last_objects_queued_) {
            return;
        }
        last_objects_queued_ = seq;
        pending_objects_ = objects;
        has_pending_objects_ = true;
        if (delivering_objects_) {
            return;
        }
        delivering_objects_ = true;
    }

    // Only the newest snapshot matters; older pending ones are overwritten
    for (;;) {
        std::vector<vision::TrackedObject> next;
        {
            std::lock_guard<std::mutex> lock(emit_mutex_);
            if (!has_pending_objects_) {
                delivering_objects_ = false;
                return;
            }
            next.swap(pending_objects_);
            has_pending_objects_ = false;
        }

        std::vector<ObjectsCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callbacks = objects_callbacks_;
        }
        for (const auto& callback : callbacks) {
            try {
                callback(next);
            } catch (const std::exception& e) {
                core::log_error(std::string("Objects callback exception: ") + e.what());
            }
        }
    }
}

void SessionCoordinatorImpl::emit_transcript(const TranscriptEntry& entry) {
    std::vector<TranscriptCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = transcript_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(entry);
        } catch (const std::exception& e) {
            core::log_error(std::string("Transcript callback exception: ") + e.what());
        }
    }
}

void SessionCoordinatorImpl::emit_error(const SessionError& error) {
    std::vector<ErrorCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = error_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            core::log_error(std::string("Error callback exception: ") + e.what());
        }
    }
}

//==============================================================================
// Public API Forwarding
//==============================================================================

SessionCoordinator::SessionCoordinator(SessionDevices devices)
    : impl_(std::make_unique<SessionCoordinatorImpl>(std::move(devices))) {}

SessionCoordinator::~SessionCoordinator() = default;

bool SessionCoordinator::start(const core::SessionConfig& config) {
    return impl_->start(config);
}

void SessionCoordinator::stop() {
    impl_->stop();
}

ConnectionState SessionCoordinator::get_state() const {
    return impl_->get_state();
}

SessionStats SessionCoordinator::get_stats() const {
    return impl_->get_stats();
}

double SessionCoordinator::get_video_aspect_ratio() const {
    return impl_->get_video_aspect_ratio();
}

std::vector<vision::TrackedObject> SessionCoordinator::get_tracked_objects() const {
    return impl_->get_tracked_objects();
}

std::vector<TranscriptEntry> SessionCoordinator::get_history() const {
    return impl_->get_history();
}

void SessionCoordinator::clear_history() {
    impl_->clear_history();
}

void SessionCoordinator::subscribe_to_state(StateCallback callback) {
    impl_->subscribe_to_state(std::move(callback));
}

void SessionCoordinator::subscribe_to_objects(ObjectsCallback callback) {
    impl_->subscribe_to_objects(std::move(callback));
}

void SessionCoordinator::subscribe_to_transcript(TranscriptCallback callback) {
    impl_->subscribe_to_transcript(std::move(callback));
}

void SessionCoordinator::subscribe_to_errors(ErrorCallback callback) {
    impl_->subscribe_to_errors(std::move(callback));
}

void SessionCoordinator::clear_subscriptions() {
    impl_->clear_subscriptions();
}

} // namespace app
