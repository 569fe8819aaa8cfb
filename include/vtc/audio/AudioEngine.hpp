#pragma once

/**
 * AudioEngine.hpp - PortAudio capture and playback
 *
 * One engine serves as both the microphone (AudioSource) and the speaker
 * (AudioSink) of a session. Capture is float32, playback is queued as int16.
 */

#include "vtc/audio/AudioIO.hpp"

#include <memory>
#include <string>
#include <vector>

namespace vtc::audio {

struct AudioConfig {
    int sample_rate = 16000;
    int channels = 1;
    int frames_per_buffer = 512;
    int input_device = -1;   // -1 = default
    int output_device = -1;
    int playback_seconds = 30;  // capacity of the playback queue
};

class AudioEngine : public AudioSource, public AudioSink {
public:
    explicit AudioEngine(const AudioConfig& config = {});
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool initialize();
    bool start();
    void stop();
    bool isRunning() const;

    void setInputCallback(AudioCallback callback) override;

    void queuePlayback(const AudioFrame& frame) override;
    void clearPlayback() override;
    size_t queuedSamples() const override;
    int sampleRate() const override { return config_.sample_rate; }

    static std::vector<std::string> listInputDevices();
    static std::vector<std::string> listOutputDevices();

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    AudioConfig config_;
};

} // namespace vtc::audio
