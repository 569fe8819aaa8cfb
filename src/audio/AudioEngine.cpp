/**
 * AudioEngine.cpp - PortAudio wrapper implementation
 *
 * Two callback streams: the input stream hands float32 blocks to the
 * recognizer, the output stream drains an int16 ring buffer filled by
 * local synthesis and the remote voice.
 */

#include "vtc/audio/AudioEngine.hpp"
#include "vtc/audio/RingBuffer.hpp"

#include <portaudio.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>

namespace vtc::audio {

namespace {

std::vector<std::string> listDevices(bool input) {
    std::vector<std::string> names;
    if (Pa_Initialize() != paNoError) return names;

    for (int i = 0, n = Pa_GetDeviceCount(); i < n; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        int channels = input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) names.emplace_back(info->name);
    }

    Pa_Terminate();
    return names;
}

} // anonymous namespace

struct AudioEngine::Impl {
    PaStream* input = nullptr;
    PaStream* output = nullptr;

    std::mutex callback_mutex;
    AudioCallback on_capture;

    std::unique_ptr<RingBuffer<int16_t>> playback;
    std::vector<int16_t> pcm_scratch;  // touched only by onPlayback

    std::atomic<bool> running{false};
    bool initialized = false;
    std::atomic<uint64_t> input_overflows{0};

    mutable std::mutex error_mutex;
    std::string last_error;

    void fail(const std::string& what, PaError err = paNoError) {
        std::lock_guard<std::mutex> lock(error_mutex);
        last_error = err == paNoError ? what : what + ": " + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << last_error << std::endl;
    }

    bool open(PaStream** stream, bool is_input, const AudioConfig& cfg) {
        int wanted = is_input ? cfg.input_device : cfg.output_device;
        PaDeviceIndex device = wanted >= 0 ? wanted
                             : is_input  ? Pa_GetDefaultInputDevice()
                                         : Pa_GetDefaultOutputDevice();
        const PaDeviceInfo* info = device == paNoDevice ? nullptr : Pa_GetDeviceInfo(device);
        if (!info) {
            fail(is_input ? "No input device available" : "No output device available");
            return false;
        }

        PaStreamParameters params{};
        params.device = device;
        params.channelCount = cfg.channels;
        params.sampleFormat = paFloat32;
        params.suggestedLatency = is_input ? info->defaultLowInputLatency
                                           : info->defaultLowOutputLatency;

        PaError err = Pa_OpenStream(stream,
                                    is_input ? &params : nullptr,
                                    is_input ? nullptr : &params,
                                    cfg.sample_rate,
                                    cfg.frames_per_buffer,
                                    paClipOff,
                                    is_input ? &Impl::onCapture : &Impl::onPlayback,
                                    this);
        if (err != paNoError) {
            *stream = nullptr;
            fail(is_input ? "Opening input stream" : "Opening output stream", err);
            return false;
        }

        std::cout << "[AudioEngine] " << (is_input ? "Input: " : "Output: ") << info->name << std::endl;
        return true;
    }

    static int onCapture(const void* input, void*, unsigned long frameCount,
                         const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags statusFlags,
                         void* userData) {
        auto* self = static_cast<Impl*>(userData);
        if (statusFlags & paInputOverflow) ++self->input_overflows;

        const auto* samples = static_cast<const float*>(input);
        if (!samples) return paContinue;

        std::lock_guard<std::mutex> lock(self->callback_mutex);
        if (self->on_capture) self->on_capture(samples, frameCount);
        return paContinue;
    }

    static int onPlayback(const void*, void* output, unsigned long frameCount,
                          const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags,
                          void* userData) {
        auto* self = static_cast<Impl*>(userData);
        auto* out = static_cast<float*>(output);

        if (self->pcm_scratch.size() < frameCount) self->pcm_scratch.resize(frameCount);
        size_t got = self->playback->pop(self->pcm_scratch.data(), frameCount);
        for (size_t i = 0; i < got; ++i) {
            out[i] = static_cast<float>(self->pcm_scratch[i]) / 32768.0f;
        }
        std::fill(out + got, out + frameCount, 0.0f);
        return paContinue;
    }

    void close() {
        for (PaStream** stream : {&input, &output}) {
            if (!*stream) continue;
            if (Pa_IsStreamActive(*stream) == 1) Pa_StopStream(*stream);
            Pa_CloseStream(*stream);
            *stream = nullptr;
        }
    }
};

AudioEngine::AudioEngine(const AudioConfig& config)
    : pImpl_(std::make_unique<Impl>())
    , config_(config)
{
    size_t capacity = static_cast<size_t>(config.sample_rate) * std::max(1, config.playback_seconds);
    pImpl_->playback = std::make_unique<RingBuffer<int16_t>>(capacity);
    pImpl_->pcm_scratch.resize(static_cast<size_t>(config.frames_per_buffer));
}

AudioEngine::~AudioEngine() {
    stop();
    if (pImpl_->initialized) Pa_Terminate();
}

bool AudioEngine::initialize() {
    if (pImpl_->initialized) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->fail("Pa_Initialize", err);
        return false;
    }
    pImpl_->initialized = true;

    std::cout << "[AudioEngine] PortAudio ready, " << Pa_GetDeviceCount() << " devices" << std::endl;
    return true;
}

bool AudioEngine::start() {
    if (pImpl_->running) return true;
    if (!initialize()) return false;

    if (!pImpl_->open(&pImpl_->input, true, config_) ||
        !pImpl_->open(&pImpl_->output, false, config_)) {
        pImpl_->close();
        return false;
    }

    for (PaStream* stream : {pImpl_->input, pImpl_->output}) {
        PaError err = Pa_StartStream(stream);
        if (err != paNoError) {
            pImpl_->fail("Pa_StartStream", err);
            pImpl_->close();
            return false;
        }
    }

    pImpl_->running = true;
    std::cout << "[AudioEngine] Started (" << config_.sample_rate << " Hz, "
              << config_.frames_per_buffer << " frames per buffer)" << std::endl;
    return true;
}

void AudioEngine::stop() {
    if (!pImpl_->running.exchange(false)) return;

    pImpl_->close();

    uint64_t overflows = pImpl_->input_overflows.exchange(0);
    std::cout << "[AudioEngine] Stopped";
    if (overflows > 0) std::cout << " (" << overflows << " input overflows)";
    std::cout << std::endl;
}

bool AudioEngine::isRunning() const {
    return pImpl_->running;
}

void AudioEngine::setInputCallback(AudioCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl_->callback_mutex);
    pImpl_->on_capture = std::move(callback);
}

void AudioEngine::queuePlayback(const AudioFrame& frame) {
    size_t pushed = pImpl_->playback->push(frame.data(), frame.size());
    if (pushed < frame.size()) {
        std::cerr << "[AudioEngine] Playback queue full, dropped "
                  << (frame.size() - pushed) << " samples" << std::endl;
    }
}

void AudioEngine::clearPlayback() {
    pImpl_->playback->clear();
}

size_t AudioEngine::queuedSamples() const {
    return pImpl_->playback->available();
}

std::vector<std::string> AudioEngine::listInputDevices() {
    return listDevices(true);
}

std::vector<std::string> AudioEngine::listOutputDevices() {
    return listDevices(false);
}

std::string AudioEngine::lastError() const {
    std::lock_guard<std::mutex> lock(pImpl_->error_mutex);
    return pImpl_->last_error;
}

} // namespace vtc::audio
