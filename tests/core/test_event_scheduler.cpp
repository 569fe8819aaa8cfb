/**
 * test_event_scheduler.cpp - Ordering, priority and delayed events
 */

#include "vtc/core/EventScheduler.hpp"
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace vtc;

namespace {

struct Recorder {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> names;

    void operator()(const Event& event) {
        std::lock_guard<std::mutex> lock(mutex);
        names.push_back(eventName(event));
        cv.notify_all();
    }

    bool waitFor(size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&]() { return names.size() >= n; });
    }
};

} // anonymous namespace

void test_fifo_order() {
    Recorder rec;
    EventScheduler s([&](const Event& e) { rec(e); });

    s.post(events::StartRequested{});
    s.post(events::Connected{"a"});
    s.post(events::RemoteSentence{"b"});

    assert(s.pending() == 3);
    assert(s.drain() == 3);
    assert(rec.names == std::vector<std::string>({"StartRequested", "Connected", "RemoteSentence"}));

    std::cout << "[PASS] test_fifo_order" << std::endl;
}

void test_interrupt_jumps_queue() {
    Recorder rec;
    EventScheduler s([&](const Event& e) { rec(e); });

    s.post(events::RemoteAudio{{1}});
    s.post(events::RemoteAudio{{2}});
    s.post(events::UserInterrupt{});

    assert(s.dispatchOne());
    assert(rec.names.front() == "UserInterrupt");
    s.drain();
    assert(rec.names.size() == 3);

    std::cout << "[PASS] test_interrupt_jumps_queue" << std::endl;
}

void test_posted_while_draining() {
    Recorder rec;
    EventScheduler* self = nullptr;
    EventScheduler s([&](const Event& e) {
        rec(e);
        if (std::holds_alternative<events::StartRequested>(e)) {
            self->post(events::Connected{"later"});
        }
    });
    self = &s;

    s.post(events::StartRequested{});
    assert(s.drain() == 2);
    assert(rec.names.back() == "Connected");

    std::cout << "[PASS] test_posted_while_draining" << std::endl;
}

void test_delayed_release() {
    Recorder rec;
    EventScheduler s([&](const Event& e) { rec(e); });

    s.postDelayed(events::StartRequested{}, std::chrono::hours(1));
    assert(s.pending() == 1);
    assert(s.drain() == 0);

    s.releaseDelayed();
    assert(s.drain() == 1);
    assert(rec.names.front() == "StartRequested");
    assert(s.pending() == 0);

    std::cout << "[PASS] test_delayed_release" << std::endl;
}

void test_loop_thread() {
    Recorder rec;
    EventScheduler* self = nullptr;
    bool inside = false;
    EventScheduler s([&](const Event& e) {
        inside = self->onLoopThread();
        rec(e);
    });
    self = &s;

    s.start();
    assert(s.isRunning());
    assert(!s.dispatchOne());  // refused while the loop owns dispatch

    s.post(events::StartRequested{});
    assert(rec.waitFor(1, std::chrono::seconds(2)));
    assert(inside);
    assert(!s.onLoopThread());

    auto posted = std::chrono::steady_clock::now();
    s.postDelayed(events::Connected{"x"}, std::chrono::milliseconds(50));
    assert(rec.waitFor(2, std::chrono::seconds(2)));
    assert(std::chrono::steady_clock::now() - posted >= std::chrono::milliseconds(50));

    s.stop();
    assert(!s.isRunning());

    std::cout << "[PASS] test_loop_thread" << std::endl;
}

void test_stop_drops_pending() {
    Recorder rec;
    EventScheduler s([&](const Event& e) { rec(e); });

    s.start();
    s.postDelayed(events::StartRequested{}, std::chrono::hours(1));
    s.stop();
    assert(s.pending() == 0);
    assert(rec.names.empty());

    std::cout << "[PASS] test_stop_drops_pending" << std::endl;
}

int main() {
    std::cout << "=== EventScheduler Tests ===" << std::endl;

    test_fifo_order();
    test_interrupt_jumps_queue();
    test_posted_while_draining();
    test_delayed_release();
    test_loop_thread();
    test_stop_drops_pending();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
