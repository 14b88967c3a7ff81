#include "vision/identity_tracker.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace vision {

namespace {
bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}
} // namespace

IdentityTracker::IdentityTracker(const TrackerConfig& config) : config_(config) {}

double IdentityTracker::center_distance(const TrackedObject& obj, const Detection& det) {
    const double c1x = (obj.xmin + obj.xmax) / 2.0;
    const double c1y = (obj.ymin + obj.ymax) / 2.0;
    const double c2x = (det.xmin + det.xmax) / 2.0;
    const double c2y = (det.ymin + det.ymax) / 2.0;
    return std::sqrt((c1x - c2x) * (c1x - c2x) + (c1y - c2y) * (c1y - c2y));
}

size_t IdentityTracker::update(const std::vector<Detection>& detections, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t created = 0;

    for (const auto& det : detections) {
        int best = -1;
        double best_distance = std::numeric_limits<double>::max();

        for (size_t i = 0; i < objects_.size(); ++i) {
            if (!iequals(objects_[i].label, det.label)) continue;
            double d = center_distance(objects_[i], det);
            if (d < best_distance) {
                best_distance = d;
                best = static_cast<int>(i);
            }
        }

        if (best >= 0 && best_distance < config_.match_distance) {
            TrackedObject& obj = objects_[best];
            obj.ymin = det.ymin;
            obj.xmin = det.xmin;
            obj.ymax = det.ymax;
            obj.xmax = det.xmax;
            obj.last_updated_ms = now_ms;
            continue;
        }

        TrackedObject obj;
        obj.id = next_id_++;
        obj.label = det.label.empty() ? std::string(kDefaultLabel) : det.label;
        obj.ymin = det.ymin;
        obj.xmin = det.xmin;
        obj.ymax = det.ymax;
        obj.xmax = det.xmax;
        obj.last_updated_ms = now_ms;
        objects_.push_back(std::move(obj));
        created++;
    }

    return created;
}

size_t IdentityTracker::prune(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t before = objects_.size();
    objects_.erase(
        std::remove_if(objects_.begin(), objects_.end(),
                       [&](const TrackedObject& o) { return now_ms - o.last_updated_ms > config_.ttl_ms; }),
        objects_.end());
    const size_t removed = before - objects_.size();
    if (removed > 0) {
        core::log_debug("IdentityTracker: pruned " + std::to_string(removed) + " stale object(s)");
    }
    return removed;
}

void IdentityTracker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.clear();
}

std::vector<TrackedObject> IdentityTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_;
}

size_t IdentityTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

} // namespace vision
