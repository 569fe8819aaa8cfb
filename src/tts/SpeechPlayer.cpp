/**
 * SpeechPlayer.cpp - Synthesis worker feeding the speaker
 *
 * Frames are pulled from the synthesizer only while the speaker queue is
 * short, so stop() never has much to flush. Every job carries the
 * generation it was queued under; stop() bumps the generation while
 * holding the output lock.
 */

#include "vtc/tts/SpeechPlayer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <thread>

namespace vtc::tts {

struct SpeechPlayer::Impl {
    SpeechSynthesizer& synthesizer;
    audio::AudioSink& sink;
    SpeechPlayerOptions options;

    struct Job {
        uint64_t generation = 0;
        uint64_t playback = 0;     // 0 for notices
        std::string text;
        bool upload = false;
    };

    std::deque<Job> jobs;
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::atomic<bool> running{true};
    std::atomic<bool> busy{false};
    std::thread worker_thread;

    // Guards generation checks against sink and upload writes
    std::mutex output_mutex;
    std::atomic<uint64_t> generation{0};

    std::mutex callback_mutex;
    FinishedCallback on_finished;
    UploadCallback on_upload;

    Impl(SpeechSynthesizer& synth, audio::AudioSink& out, SpeechPlayerOptions opts)
        : synthesizer(synth), sink(out), options(opts) {}

    bool current(const Job& job) const {
        return running && job.generation == generation;
    }

    bool emit(const Job& job, const AudioFrame& frame) {
        std::lock_guard<std::mutex> lock(output_mutex);
        if (!current(job)) return false;

        sink.queuePlayback(frame);
        if (job.upload) {
            std::lock_guard<std::mutex> cb_lock(callback_mutex);
            if (on_upload) on_upload(frame);
        }
        return true;
    }

    void waitForRoom(const Job& job, size_t limit) {
        while (current(job) && sink.queuedSamples() > limit) {
            std::this_thread::sleep_for(std::chrono::milliseconds(options.poll_ms));
        }
    }

    void run(const Job& job) {
        const char* kind = job.playback ? "playback" : "notice";
        std::cout << "[SpeechPlayer] Start " << kind << " " << job.playback
                  << ": \"" << job.text << "\"" << std::endl;

        size_t limit = static_cast<size_t>(sink.sampleRate()) * options.max_queued_ms / 1000;
        auto stream = synthesizer.synthesize(job.text);

        AudioFrame frame;
        size_t frames = 0;
        while (current(job) && stream->next(frame)) {
            waitForRoom(job, limit);
            if (!emit(job, frame)) break;
            ++frames;
        }

        // Let the speaker finish what is already queued
        waitForRoom(job, 0);

        if (!current(job)) {
            std::cout << "[SpeechPlayer] Aborted " << kind << " " << job.playback
                      << " after " << frames << " frames" << std::endl;
            return;
        }

        ErrorKind error = stream->error();
        if (error != ErrorKind::None) {
            std::cerr << "[SpeechPlayer] Synthesis failed after " << frames << " frames" << std::endl;
        } else {
            std::cout << "[SpeechPlayer] Finished " << kind << " " << job.playback
                      << " (" << frames << " frames)" << std::endl;
        }

        if (job.playback == 0) return;

        std::lock_guard<std::mutex> lock(callback_mutex);
        if (on_finished) on_finished(job.playback, error);
    }

    void worker() {
        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                queue_cv.wait(lock, [this]() { return !jobs.empty() || !running; });
                if (!running) break;
                job = std::move(jobs.front());
                jobs.pop_front();
                busy = true;
            }

            if (current(job)) run(job);

            std::lock_guard<std::mutex> lock(queue_mutex);
            busy = false;
        }
    }

    void enqueue(Job job) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            job.generation = generation;
            jobs.push_back(std::move(job));
        }
        queue_cv.notify_one();
    }
};

SpeechPlayer::SpeechPlayer(SpeechSynthesizer& synthesizer, audio::AudioSink& sink,
                           SpeechPlayerOptions options)
    : impl_(std::make_unique<Impl>(synthesizer, sink, options)) {
    impl_->worker_thread = std::thread([this]() { impl_->worker(); });
}

SpeechPlayer::~SpeechPlayer() {
    {
        std::lock_guard<std::mutex> lock(impl_->queue_mutex);
        impl_->running = false;
    }
    impl_->queue_cv.notify_all();
    if (impl_->worker_thread.joinable()) {
        impl_->worker_thread.join();
    }
}

void SpeechPlayer::setFinishedCallback(FinishedCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->on_finished = std::move(callback);
}

void SpeechPlayer::setUploadCallback(UploadCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->on_upload = std::move(callback);
}

void SpeechPlayer::play(uint64_t playback, const std::string& text, bool upload) {
    if (playback == 0) {
        std::cerr << "[SpeechPlayer] Refusing playback id 0" << std::endl;
        return;
    }
    impl_->enqueue({0, playback, text, upload});
}

void SpeechPlayer::speakNotice(const std::string& text) {
    impl_->enqueue({0, 0, text, false});
}

void SpeechPlayer::stop() {
    std::scoped_lock lock(impl_->queue_mutex, impl_->output_mutex);
    impl_->jobs.clear();
    ++impl_->generation;
    impl_->sink.clearPlayback();
}

bool SpeechPlayer::isActive() const {
    std::lock_guard<std::mutex> lock(impl_->queue_mutex);
    return impl_->busy || !impl_->jobs.empty();
}

} // namespace vtc::tts
