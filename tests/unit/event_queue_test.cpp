#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include "core/event_queue.hpp"

static void test_fifo_and_capacity() {
    core::EventQueue<std::string> q(2);
    assert(q.push("a"));
    assert(q.push("b"));
    assert(!q.push("c"));
    assert(q.dropped_count() == 1);
    assert(q.size() == 2);

    std::string v;
    assert(q.pop(v) && v == "a");
    assert(q.pop(v) && v == "b");
}

static void test_stop_discards_and_wakes() {
    core::EventQueue<int> q;
    q.push(1);
    q.push(2);
    q.stop();
    int v = 0;
    assert(!q.pop(v));
    assert(!q.push(3));
    assert(q.size() == 0);

    core::EventQueue<int> blocked;
    bool returned = false;
    std::thread consumer([&]() {
        int x = 0;
        returned = !blocked.pop(x);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    blocked.stop();
    consumer.join();
    assert(returned);
    assert(blocked.is_stopped());
    assert(!blocked.push(5));
}

static void test_cross_thread() {
    core::EventQueue<int> q(1024);
    std::thread producer([&]() {
        for (int i = 0; i < 500; ++i) {
            while (!q.push(int(i))) std::this_thread::yield();
        }
    });
    for (int i = 0; i < 500; ++i) {
        int v = -1;
        assert(q.pop(v));
        assert(v == i);
    }
    producer.join();
}

int main() {
    test_fifo_and_capacity();
    test_stop_discards_and_wakes();
    test_cross_thread();
    return 0;
}
