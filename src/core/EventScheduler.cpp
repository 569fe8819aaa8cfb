/**
 * EventScheduler.cpp - Event queue and loop thread
 */

#include "vtc/core/EventScheduler.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace vtc {

using Clock = std::chrono::steady_clock;

struct EventScheduler::Impl {
    Handler handler;

    mutable std::mutex mutex;
    std::condition_variable cv;

    std::deque<Event> urgent;
    std::deque<Event> normal;

    struct Delayed {
        Clock::time_point due;
        uint64_t seq;
        Event event;
    };
    std::vector<Delayed> delayed;
    uint64_t delayed_seq = 0;

    std::atomic<bool> running{false};
    std::thread loop_thread;
    std::atomic<std::thread::id> dispatch_thread{};

    // Caller holds mutex
    void promoteDue(Clock::time_point now) {
        std::sort(delayed.begin(), delayed.end(), [](const Delayed& a, const Delayed& b) {
            return a.due != b.due ? a.due < b.due : a.seq < b.seq;
        });
        auto it = delayed.begin();
        while (it != delayed.end() && it->due <= now) {
            enqueue(std::move(it->event));
            ++it;
        }
        delayed.erase(delayed.begin(), it);
    }

    // Caller holds mutex
    void enqueue(Event event) {
        if (isHighPriority(event)) {
            urgent.push_back(std::move(event));
        } else {
            normal.push_back(std::move(event));
        }
    }

    // Caller holds mutex
    std::optional<Event> takeNext() {
        promoteDue(Clock::now());
        std::deque<Event>& q = !urgent.empty() ? urgent : normal;
        if (q.empty()) return std::nullopt;
        Event event = std::move(q.front());
        q.pop_front();
        return event;
    }

    void dispatch(const Event& event) {
        dispatch_thread = std::this_thread::get_id();
        handler(event);
        dispatch_thread = std::thread::id{};
    }

    void loop() {
        std::cout << "[Scheduler] Loop started" << std::endl;

        while (running) {
            std::optional<Event> next;
            {
                std::unique_lock<std::mutex> lock(mutex);
                if (!running) break;
                next = takeNext();
                if (!next) {
                    if (delayed.empty()) {
                        cv.wait(lock);
                    } else {
                        auto due = std::min_element(delayed.begin(), delayed.end(),
                            [](const Delayed& a, const Delayed& b) { return a.due < b.due; })->due;
                        cv.wait_until(lock, due);
                    }
                    continue;
                }
            }
            dispatch(*next);
        }

        std::cout << "[Scheduler] Loop stopped" << std::endl;
    }
};

EventScheduler::EventScheduler(Handler handler) : impl_(std::make_unique<Impl>()) {
    impl_->handler = std::move(handler);
}

EventScheduler::~EventScheduler() { stop(); }

void EventScheduler::post(Event event) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->enqueue(std::move(event));
    }
    impl_->cv.notify_one();
}

void EventScheduler::postDelayed(Event event, std::chrono::milliseconds delay) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->delayed.push_back({Clock::now() + delay, impl_->delayed_seq++, std::move(event)});
    }
    impl_->cv.notify_one();
}

void EventScheduler::start() {
    if (impl_->running.exchange(true)) return;
    impl_->loop_thread = std::thread([this]() { impl_->loop(); });
}

void EventScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->running.exchange(false)) return;
    }
    impl_->cv.notify_all();
    if (impl_->loop_thread.joinable()) {
        impl_->loop_thread.join();
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    size_t dropped = impl_->urgent.size() + impl_->normal.size() + impl_->delayed.size();
    if (dropped > 0) {
        std::cout << "[Scheduler] Dropped " << dropped << " pending events" << std::endl;
    }
    impl_->urgent.clear();
    impl_->normal.clear();
    impl_->delayed.clear();
}

bool EventScheduler::isRunning() const { return impl_->running; }

bool EventScheduler::onLoopThread() const {
    return impl_->dispatch_thread.load() == std::this_thread::get_id();
}

bool EventScheduler::dispatchOne() {
    if (impl_->running) {
        std::cerr << "[Scheduler] dispatchOne() called while the loop is running" << std::endl;
        return false;
    }

    std::optional<Event> next;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        next = impl_->takeNext();
    }
    if (!next) return false;

    impl_->dispatch(*next);
    return true;
}

size_t EventScheduler::drain() {
    size_t count = 0;
    while (dispatchOne()) {
        ++count;
    }
    return count;
}

void EventScheduler::releaseDelayed() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->promoteDue(Clock::time_point::max());
    }
    impl_->cv.notify_one();
}

size_t EventScheduler::pending() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->urgent.size() + impl_->normal.size() + impl_->delayed.size();
}

} // namespace vtc
