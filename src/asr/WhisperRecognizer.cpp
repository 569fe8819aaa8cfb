/**
 * WhisperRecognizer.cpp - VAD on the capture thread, whisper on a worker
 */

#include "vtc/asr/WhisperRecognizer.hpp"
#include "vtc/asr/STTEngine.hpp"
#include "vtc/audio/VADProcessor.hpp"

#include <atomic>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace vtc::asr {

struct WhisperRecognizer::Impl {
    std::unique_ptr<STTEngine> stt;
    std::unique_ptr<audio::VADProcessor> vad;
    std::mutex vad_mutex;

    struct Segment {
        std::vector<float> samples;
        uint64_t generation;
    };
    std::queue<Segment> segments;
    std::mutex queue_mutex;
    std::condition_variable queue_cv;

    std::atomic<uint64_t> generation{0};
    std::atomic<bool> running{false};
    std::thread worker_thread;

    std::mutex callback_mutex;
    ResultCallback callback;

    void worker() {
        while (true) {
            Segment segment;
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                queue_cv.wait(lock, [this]() { return !segments.empty() || !running; });
                if (!running) break;
                segment = std::move(segments.front());
                segments.pop();
            }

            if (segment.generation != generation) continue;

            std::cout << "[Recognizer] Transcribing..." << std::endl;
            std::string text = stt->transcribe(segment.samples);

            // reset() while transcribing makes the result stale
            if (text.empty() || segment.generation != generation) continue;

            std::cout << "[Recognizer] User: " << text << std::endl;
            std::lock_guard<std::mutex> lock(callback_mutex);
            if (callback) callback(text);
        }
    }
};

WhisperRecognizer::WhisperRecognizer(const WhisperOptions& options)
    : impl_(std::make_unique<Impl>()) {
    impl_->stt = std::make_unique<STTEngine>(options.model_path, options.language, options.threads);

    if (options.sample_rate != STTEngine::getSampleRate()) {
        std::cerr << "[Recognizer] Session rate " << options.sample_rate
                  << " Hz differs from whisper's " << STTEngine::getSampleRate() << " Hz" << std::endl;
    }

    impl_->vad = std::make_unique<audio::VADProcessor>(
        options.sample_rate, static_cast<audio::VADMode>(options.vad_mode));
    impl_->vad->setSilenceTimeout(options.silence_timeout_ms);
    impl_->vad->setMinSpeechDuration(options.min_speech_ms);
    impl_->vad->setSpeechCallback([this](const std::vector<float>& segment, int duration_ms) {
        std::cout << "[Recognizer] Speech segment " << duration_ms << " ms" << std::endl;
        {
            std::lock_guard<std::mutex> lock(impl_->queue_mutex);
            impl_->segments.push({segment, impl_->generation.load()});
        }
        impl_->queue_cv.notify_one();
    });

    impl_->running = true;
    impl_->worker_thread = std::thread([this]() { impl_->worker(); });
}

WhisperRecognizer::~WhisperRecognizer() {
    {
        std::lock_guard<std::mutex> lock(impl_->queue_mutex);
        impl_->running = false;
    }
    impl_->queue_cv.notify_all();
    if (impl_->worker_thread.joinable()) {
        impl_->worker_thread.join();
    }
}

bool WhisperRecognizer::isReady() const {
    return impl_->stt->isReady() && impl_->vad->isReady();
}

void WhisperRecognizer::setResultCallback(ResultCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->callback = std::move(callback);
}

void WhisperRecognizer::feed(const float* samples, size_t count) {
    std::lock_guard<std::mutex> lock(impl_->vad_mutex);
    impl_->vad->process(samples, count);
}

void WhisperRecognizer::reset() {
    ++impl_->generation;
    {
        std::lock_guard<std::mutex> lock(impl_->vad_mutex);
        impl_->vad->reset();
    }
    std::lock_guard<std::mutex> lock(impl_->queue_mutex);
    std::queue<Impl::Segment>().swap(impl_->segments);
}

} // namespace vtc::asr
