/**
 * VADProcessor.cpp - Cuts the microphone stream into utterances with libfvad
 *
 * States: Quiet -> (ONSET_FRAMES voiced in a row) -> Talking -> (silence
 * timeout) -> segment emitted -> Quiet. Frames heard while Quiet are kept as
 * pre-roll so the first syllable before onset is not lost.
 */

#include "vtc/audio/VADProcessor.hpp"

#include <fvad.h>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <iostream>

namespace vtc::audio {

namespace {

constexpr int ONSET_FRAMES = 2;
constexpr int PRE_ROLL_MS = 300;
constexpr int MAX_SEGMENT_MS = 30000;

} // anonymous namespace

struct VADProcessor::Impl {
    Fvad* vad = nullptr;

    int sample_rate = 16000;
    int frame_ms = 30;
    size_t frame_samples = 480;

    std::vector<float> pending;       // samples not yet making a full frame
    std::vector<int16_t> scratch;     // pending frame converted for libfvad
    std::deque<std::vector<float>> pre_roll;
    size_t pre_roll_limit = 0;

    std::vector<float> segment;
    bool talking = false;
    int onset_run = 0;
    int silence_run = 0;
    int voiced_total = 0;

    int silence_timeout_ms = 800;
    int min_speech_ms = 300;

    SpeechCallback callback;

    ~Impl() {
        if (vad) fvad_free(vad);
    }

    int silenceLimit() const { return std::max(1, silence_timeout_ms / frame_ms); }
    int minVoiced() const { return min_speech_ms / frame_ms; }
    int segmentMs() const { return static_cast<int>(segment.size() * 1000 / sample_rate); }

    bool classify(const std::vector<float>& frame) {
        for (size_t i = 0; i < frame_samples; ++i) {
            scratch[i] = static_cast<int16_t>(std::clamp(frame[i], -1.0f, 1.0f) * 32767.0f);
        }
        return fvad_process(vad, scratch.data(), frame_samples) == 1;
    }

    void onFrame(const std::vector<float>& frame, bool voiced) {
        if (!talking) {
            onset_run = voiced ? onset_run + 1 : 0;
            pre_roll.push_back(frame);
            if (onset_run < ONSET_FRAMES) {
                while (pre_roll.size() > pre_roll_limit + ONSET_FRAMES) pre_roll.pop_front();
                return;
            }
            // Onset: the pre-roll already holds the voiced frames
            for (const auto& f : pre_roll) segment.insert(segment.end(), f.begin(), f.end());
            pre_roll.clear();
            talking = true;
            voiced_total = onset_run;
            silence_run = 0;
            return;
        }

        segment.insert(segment.end(), frame.begin(), frame.end());
        if (voiced) {
            ++voiced_total;
            silence_run = 0;
        } else if (++silence_run >= silenceLimit()) {
            finishSegment();
            return;
        }

        if (segmentMs() >= MAX_SEGMENT_MS) {
            std::cout << "[VADProcessor] Segment hit " << MAX_SEGMENT_MS << " ms, flushing" << std::endl;
            finishSegment();
        }
    }

    void finishSegment() {
        // A cough followed by silence is not an utterance
        if (voiced_total >= minVoiced() && callback) {
            callback(segment, segmentMs());
        }
        clearSegment();
    }

    void clearSegment() {
        segment.clear();
        talking = false;
        onset_run = 0;
        silence_run = 0;
        voiced_total = 0;
    }
};

VADProcessor::VADProcessor(int sample_rate, VADMode mode, int frame_ms)
    : pImpl_(std::make_unique<Impl>()) {
    auto& impl = *pImpl_;
    impl.sample_rate = sample_rate;
    impl.frame_ms = frame_ms;
    impl.frame_samples = static_cast<size_t>(sample_rate) * frame_ms / 1000;
    impl.scratch.resize(impl.frame_samples);
    impl.pending.reserve(impl.frame_samples);
    impl.pre_roll_limit = static_cast<size_t>(PRE_ROLL_MS / frame_ms);

    impl.vad = fvad_new();
    if (!impl.vad) {
        std::cerr << "[VADProcessor] fvad_new failed" << std::endl;
        return;
    }
    if (fvad_set_sample_rate(impl.vad, sample_rate) < 0) {
        std::cerr << "[VADProcessor] Unsupported sample rate " << sample_rate << std::endl;
        fvad_free(impl.vad);
        impl.vad = nullptr;
        return;
    }
    if (fvad_set_mode(impl.vad, static_cast<int>(mode)) < 0) {
        std::cerr << "[VADProcessor] Unsupported mode " << static_cast<int>(mode)
                  << ", keeping libfvad default" << std::endl;
    }

    std::cout << "[VADProcessor] " << sample_rate << " Hz, " << frame_ms << " ms frames, mode "
              << static_cast<int>(mode) << std::endl;
}

VADProcessor::~VADProcessor() = default;

bool VADProcessor::isReady() const {
    return pImpl_->vad != nullptr;
}

void VADProcessor::process(const float* samples, size_t count) {
    auto& impl = *pImpl_;
    if (!impl.vad) return;

    while (count > 0) {
        size_t take = std::min(count, impl.frame_samples - impl.pending.size());
        impl.pending.insert(impl.pending.end(), samples, samples + take);
        samples += take;
        count -= take;

        if (impl.pending.size() == impl.frame_samples) {
            bool voiced = impl.classify(impl.pending);
            impl.onFrame(impl.pending, voiced);
            impl.pending.clear();
        }
    }
}

void VADProcessor::setSpeechCallback(SpeechCallback callback) {
    pImpl_->callback = std::move(callback);
}

void VADProcessor::setSilenceTimeout(int timeout_ms) {
    pImpl_->silence_timeout_ms = timeout_ms;
}

void VADProcessor::setMinSpeechDuration(int min_ms) {
    pImpl_->min_speech_ms = min_ms;
}

void VADProcessor::reset() {
    auto& impl = *pImpl_;
    impl.pending.clear();
    impl.pre_roll.clear();
    impl.clearSegment();
    if (impl.vad) fvad_reset(impl.vad);
}

} // namespace vtc::audio
