#include <cassert>
#include <cstdint>
#include <thread>
#include <vector>
#include "core/ring_buffer.hpp"

static void test_push_pop() {
    core::SpscRingBuffer<int16_t> rb(8);
    std::vector<int16_t> in{1, 2, 3, 4, 5};
    assert(rb.try_push(in.data(), in.size()));
    assert(rb.size() == 5);
    std::vector<int16_t> out(5);
    size_t r = rb.pop(out.data(), out.size());
    assert(r == out.size());
    for (size_t i = 0; i < out.size(); ++i) assert(out[i] == in[i]);
    assert(rb.size() == 0);
}

static void test_all_or_nothing() {
    core::SpscRingBuffer<uint8_t> rb(4);
    uint8_t data[3] = {1, 2, 3};
    assert(rb.try_push(data, 3));
    assert(!rb.try_push(data, 2));
    assert(rb.size() == 3);
    assert(rb.dropped_count() == 2);

    // Wraps around the end of storage
    uint8_t out[4] = {0, 0, 0, 0};
    assert(rb.pop(out, 2) == 2);
    assert(rb.try_push(data, 3));
    assert(rb.pop(out, 4) == 4);
    assert(out[0] == 3 && out[1] == 1 && out[2] == 2 && out[3] == 3);

    rb.try_push(data, 2);
    rb.clear();
    assert(rb.size() == 0);
}

static void test_threaded_order() {
    core::SpscRingBuffer<uint32_t> rb(64);
    const uint32_t total = 20000;
    std::thread producer([&]() {
        uint32_t next = 0;
        while (next < total) {
            if (rb.try_push(&next, 1)) {
                ++next;
            } else {
                std::this_thread::yield();
            }
        }
    });

    uint32_t expected = 0;
    while (expected < total) {
        uint32_t v = 0;
        if (rb.pop(&v, 1) == 1) {
            assert(v == expected);
            ++expected;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();
}

int main() {
    test_push_pop();
    test_all_or_nothing();
    test_threaded_order();
    return 0;
}
