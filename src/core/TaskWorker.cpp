/**
 * TaskWorker.cpp - Single background job thread
 */

#include "vtc/core/TaskWorker.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>

namespace vtc {

struct TaskWorker::Impl {
    std::string name;
    std::queue<Job> jobs;
    std::mutex mutex;
    std::condition_variable cv;
    std::thread thread;
    std::atomic<bool> running{false};

    void worker() {
        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this]() { return !jobs.empty() || !running; });
                if (!running) break;
                job = std::move(jobs.front());
                jobs.pop();
            }

            try {
                job();
            } catch (const std::exception& e) {
                std::cerr << "[" << name << "] Job failed: " << e.what() << std::endl;
            }
        }
    }
};

TaskWorker::TaskWorker(std::string name) : impl_(std::make_unique<Impl>()) {
    impl_->name = std::move(name);
    impl_->running = true;
    impl_->thread = std::thread([this]() { impl_->worker(); });
}

TaskWorker::~TaskWorker() { shutdown(); }

void TaskWorker::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->running) {
            std::cerr << "[" << impl_->name << "] Rejecting job after shutdown" << std::endl;
            return;
        }
        impl_->jobs.push(std::move(job));
    }
    impl_->cv.notify_one();
}

size_t TaskWorker::cancelPending() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    size_t dropped = impl_->jobs.size();
    std::queue<Job>().swap(impl_->jobs);
    return dropped;
}

void TaskWorker::shutdown() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->running) return;
        impl_->running = false;
        std::queue<Job>().swap(impl_->jobs);
    }
    impl_->cv.notify_all();
    if (impl_->thread.joinable()) {
        impl_->thread.join();
    }
}

} // namespace vtc
