#include <cassert>
#include <string>
#include "vision/detection_parser.hpp"

using vision::Detection;
using vision::DetectionParser;

static void test_single_box() {
    auto dets = DetectionParser::scan("I see a coffee cup at [200, 300, 450, 500]", 42);
    assert(dets.size() == 1);
    assert(dets[0].ymin == 200);
    assert(dets[0].xmin == 300);
    assert(dets[0].ymax == 450);
    assert(dets[0].xmax == 500);
    assert(dets[0].observed_at_ms == 42);
    // Last token before the bracket, even when it is a preposition
    assert(dets[0].label == "at");
}

static void test_labels() {
    auto dets = DetectionParser::scan("a laptop [600, 100, 950, 800] and mug[1,2,3,4]", 0);
    assert(dets.size() == 2);
    assert(dets[0].label == "laptop");
    assert(dets[1].label == "mug");

    auto bare = DetectionParser::scan("[0, 0, 1000, 1000]", 0);
    assert(bare.size() == 1);
    assert(bare[0].label == "Object");
    assert(bare[0].ymax == 1000 && bare[0].xmax == 1000);

    // Punctuation right before the bracket leaves no label
    auto punct = DetectionParser::scan("cup: [10, 20, 30, 40]", 0);
    assert(punct.size() == 1);
    assert(punct[0].label == "Object");
}

static void test_separators() {
    auto dets = DetectionParser::scan("box [ 1 2\t3 ,4 ]", 0);
    assert(dets.size() == 1);
    assert(dets[0].ymin == 1 && dets[0].xmin == 2 && dets[0].ymax == 3 && dets[0].xmax == 4);
}

static void test_malformed_is_skipped() {
    DetectionParser parser;
    auto dets = parser.feed("bad [1, 2, x, 4] then cup [5, 6, 7, 8] and [1, 2, 3] and [1,,2,3,4]", 0);
    assert(dets.size() == 1);
    assert(dets[0].label == "cup");
    assert(dets[0].ymin == 5);
    assert(parser.malformed_count() == 3);

    // Out of range is rejected, not clamped
    assert(DetectionParser::scan("big [0, 0, 1001, 5]", 0).empty());
    assert(DetectionParser::scan("neg [0, -1, 10, 5]", 0).empty());
}

static void test_split_across_deltas() {
    DetectionParser parser;
    assert(parser.feed("I can see a phone [120, 4", 1).empty());
    auto dets = parser.feed("5, 300, 600]", 2);
    assert(dets.size() == 1);
    assert(dets[0].label == "phone");
    assert(dets[0].ymin == 120);
    assert(dets[0].xmin == 45);
    assert(dets[0].observed_at_ms == 2);

    // The buffer keeps earlier text, so later scans repeat the box
    auto again = parser.feed(" nice", 3);
    assert(again.size() == 1);
}

static void test_buffer_cap() {
    DetectionParser parser(500);
    parser.feed("old [1, 2, 3, 4]", 0);
    std::string filler(600, 'z');
    auto dets = parser.feed(filler, 1);
    assert(dets.empty());
    assert(parser.buffer().size() == 500);
    assert(parser.buffer() == filler.substr(100));

    parser.reset();
    assert(parser.buffer().empty());
}

int main() {
    test_single_box();
    test_labels();
    test_separators();
    test_malformed_is_skipped();
    test_split_across_deltas();
    test_buffer_cap();
    return 0;
}
