#pragma once

/**
 * EventScheduler.hpp - Single consumer event loop
 *
 * Any thread may post. Exactly one thread (the loop, or the caller of
 * drain() when the loop is not running) hands events to the handler, one
 * at a time, in posting order. UserInterrupt jumps the queue.
 */

#include "vtc/core/Event.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace vtc {

class EventScheduler {
public:
    using Handler = std::function<void(const Event&)>;

    explicit EventScheduler(Handler handler);
    ~EventScheduler();

    EventScheduler(const EventScheduler&) = delete;
    EventScheduler& operator=(const EventScheduler&) = delete;

    void post(Event event);

    /// Queue the event once delay has elapsed (reconnect back-off).
    void postDelayed(Event event, std::chrono::milliseconds delay);

    /// Start the loop thread.
    void start();

    /// Stop the loop thread. Queued events are dropped.
    void stop();

    bool isRunning() const;

    /// True when called from inside the handler.
    bool onLoopThread() const;

    /**
     * Dispatch every due event on the calling thread, including those
     * posted while draining. Only valid while the loop thread is stopped.
     * @return number of events dispatched
     */
    size_t drain();

    /// Dispatch a single due event. Returns false if none was queued.
    bool dispatchOne();

    /// Move every delayed event into the queue now, regardless of its due time.
    void releaseDelayed();

    /// Queued events (due now) plus delayed ones.
    size_t pending() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vtc
