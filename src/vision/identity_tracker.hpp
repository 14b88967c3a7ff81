#pragma once

#include "vision/detection.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace vision {

/// Tuning for identity reconciliation
struct TrackerConfig {
    double match_distance = 200.0;   ///< Max centre distance (0-1000 space) to keep an identity
    int64_t ttl_ms = 3000;           ///< Objects not updated for longer than this are pruned
};

/**
 * @brief Keeps stable identities for boxes reported over time
 *
 * Each detection is matched against live objects with the same label
 * (case-insensitive). The nearest one by box centre wins if it is closer than
 * match_distance; otherwise a new identity is created.
 *
 * Matching is greedy and sequential. An object already updated earlier in the
 * same batch can be matched again by a later detection, so two nearby
 * same-label boxes in one batch may collapse onto one identity or swap
 * identities. This is accepted behaviour, there is no global assignment.
 *
 * All public methods are thread-safe and mutually exclusive, so batch updates
 * from the event loop and the periodic prune sweep can run on different threads.
 */
class IdentityTracker {
public:
    explicit IdentityTracker(const TrackerConfig& config = TrackerConfig());

    /// Reconcile a batch in order. Returns the number of new identities created.
    size_t update(const std::vector<Detection>& detections, int64_t now_ms);

    /// Drop objects whose age exceeds the TTL. Returns the number removed.
    size_t prune(int64_t now_ms);

    void clear();

    /// Copy of the live objects, in creation order.
    std::vector<TrackedObject> snapshot() const;

    size_t size() const;

    const TrackerConfig& config() const { return config_; }

    static double center_distance(const TrackedObject& obj, const Detection& det);

private:
    TrackerConfig config_;
    mutable std::mutex mutex_;
    std::vector<TrackedObject> objects_;
    uint64_t next_id_ = 1;   // ids are never reused, even across clear()
};

} // namespace vision
