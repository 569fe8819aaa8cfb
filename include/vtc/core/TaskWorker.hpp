#pragma once

/**
 * TaskWorker.hpp - Background thread running jobs in submission order
 *
 * Used for the slow parts of a session (camera open, vision pipeline) so
 * the event loop never blocks on them. Jobs report back by posting events.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace vtc {

class TaskWorker {
public:
    using Job = std::function<void()>;

    explicit TaskWorker(std::string name);
    ~TaskWorker();

    TaskWorker(const TaskWorker&) = delete;
    TaskWorker& operator=(const TaskWorker&) = delete;

    void submit(Job job);

    /// Drop jobs not yet started. A running job is left to finish.
    size_t cancelPending();

    /// Stop accepting jobs, finish the running one and join.
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vtc
