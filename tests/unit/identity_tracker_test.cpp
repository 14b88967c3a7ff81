#include <cassert>
#include <cmath>
#include <set>
#include <vector>
#include "vision/identity_tracker.hpp"

using vision::Detection;
using vision::IdentityTracker;

static Detection det(const char* label, int ymin, int xmin, int ymax, int xmax) {
    Detection d;
    d.label = label;
    d.ymin = ymin;
    d.xmin = xmin;
    d.ymax = ymax;
    d.xmax = xmax;
    return d;
}

static void test_close_detection_keeps_identity() {
    IdentityTracker tracker;
    assert(tracker.update({det("cup", 200, 300, 450, 500)}, 0) == 1);
    auto first = tracker.snapshot();
    assert(first.size() == 1);

    // Centre moves by (50, 50): ~70.7 units
    assert(tracker.update({det("CUP", 250, 350, 500, 550)}, 100) == 0);
    auto second = tracker.snapshot();
    assert(second.size() == 1);
    assert(second[0].id == first[0].id);
    assert(second[0].label == "cup");
    assert(second[0].ymin == 250 && second[0].xmax == 550);
    assert(second[0].last_updated_ms == 100);
}

static void test_far_detection_creates_identity() {
    IdentityTracker tracker;
    tracker.update({det("cup", 0, 0, 100, 100)}, 0);
    // Centre moves exactly 200 units: not below the threshold
    assert(tracker.update({det("cup", 200, 0, 300, 100)}, 10) == 1);
    auto objs = tracker.snapshot();
    assert(objs.size() == 2);
    assert(objs[0].id != objs[1].id);

    // Different label never matches
    assert(tracker.update({det("phone", 0, 0, 100, 100)}, 20) == 1);
    assert(tracker.size() == 3);
}

static void test_nearest_candidate_wins() {
    IdentityTracker tracker;
    tracker.update({det("cup", 0, 0, 100, 100), det("cup", 0, 400, 100, 500)}, 0);
    auto objs = tracker.snapshot();
    assert(objs.size() == 2);
    tracker.update({det("cup", 0, 380, 100, 480)}, 5);
    auto after = tracker.snapshot();
    assert(after[1].id == objs[1].id);
    assert(after[1].xmin == 380);
    assert(after[0].xmin == 0);
}

static void test_same_batch_reuses_target() {
    IdentityTracker tracker;
    tracker.update({det("cup", 0, 0, 100, 100)}, 0);
    // Both nearby detections land on the one existing object
    assert(tracker.update({det("cup", 0, 10, 100, 110), det("cup", 0, 20, 100, 120)}, 1) == 0);
    auto objs = tracker.snapshot();
    assert(objs.size() == 1);
    assert(objs[0].xmin == 20);
}

static void test_prune() {
    IdentityTracker tracker;
    tracker.update({det("old", 0, 0, 10, 10)}, 0);
    tracker.update({det("recent", 0, 0, 10, 10)}, 1);

    // Age exactly 3000 / 2999 survives
    assert(tracker.prune(3000) == 0);
    assert(tracker.size() == 2);
    assert(tracker.prune(3001) == 1);
    auto objs = tracker.snapshot();
    assert(objs.size() == 1);
    assert(objs[0].label == "recent");
    assert(tracker.prune(3002) == 1);
    assert(tracker.size() == 0);
}

static void test_ids_never_reused() {
    IdentityTracker tracker;
    std::set<uint64_t> seen;
    tracker.update({det("a", 0, 0, 10, 10)}, 0);
    seen.insert(tracker.snapshot()[0].id);
    tracker.clear();
    assert(tracker.size() == 0);
    tracker.update({det("a", 0, 0, 10, 10)}, 0);
    uint64_t id = tracker.snapshot()[0].id;
    assert(seen.count(id) == 0);
    assert(id != 0);
}

static void test_center_distance() {
    vision::TrackedObject obj;
    obj.ymin = 0; obj.xmin = 0; obj.ymax = 100; obj.xmax = 100;
    assert(IdentityTracker::center_distance(obj, det("x", 30, 40, 130, 140)) == 50.0);
}

static void test_percent_rect() {
    vision::TrackedObject obj;
    obj.ymin = 200; obj.xmin = 100; obj.ymax = 600; obj.xmax = 350;
    vision::PercentRect r = vision::to_percent_rect(obj);
    assert(std::fabs(r.left - 10.0f) < 1e-4f);
    assert(std::fabs(r.top - 20.0f) < 1e-4f);
    assert(std::fabs(r.width - 25.0f) < 1e-4f);
    assert(std::fabs(r.height - 40.0f) < 1e-4f);
}

int main() {
    test_close_detection_keeps_identity();
    test_far_detection_creates_identity();
    test_nearest_candidate_wins();
    test_same_batch_reuses_target();
    test_prune();
    test_ids_never_reused();
    test_center_distance();
    test_percent_rect();
    return 0;
}
