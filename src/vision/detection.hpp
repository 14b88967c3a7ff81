#pragma once

#include <cstdint>
#include <string>

namespace vision {

/// Upper bound of the normalized box coordinate space.
constexpr int kCoordinateMax = 1000;

/// Label used when no label text precedes a box.
constexpr const char* kDefaultLabel = "Object";

/// One parsed bounding box. Transient: produced by a parse, consumed by the tracker.
struct Detection {
    std::string label;
    int ymin = 0;              ///< [0,1000], top edge
    int xmin = 0;              ///< [0,1000], left edge
    int ymax = 0;              ///< [0,1000], bottom edge
    int xmax = 0;              ///< [0,1000], right edge
    int64_t observed_at_ms = 0;
};

/// A detection reconciled into a persistent identity.
struct TrackedObject {
    uint64_t id = 0;           ///< Stable identity, never reused
    std::string label;
    int ymin = 0;
    int xmin = 0;
    int ymax = 0;
    int xmax = 0;
    int64_t last_updated_ms = 0;
};

/// Box expressed as percentages of the frame, for overlays.
struct PercentRect {
    float left = 0.0f;
    float top = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
};

inline PercentRect to_percent_rect(const TrackedObject& obj) {
    PercentRect r;
    r.left = obj.xmin / 10.0f;
    r.top = obj.ymin / 10.0f;
    r.width = (obj.xmax - obj.xmin) / 10.0f;
    r.height = (obj.ymax - obj.ymin) / 10.0f;
    return r;
}

} // namespace vision
