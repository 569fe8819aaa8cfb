#pragma once

/**
 * AudioIO.hpp - Microphone and speaker seams
 */

#include "vtc/core/Types.hpp"

#include <cstddef>
#include <functional>

namespace vtc::audio {

/// Mono float32 samples in [-1, 1] at the session rate.
using AudioCallback = std::function<void(const float* samples, size_t count)>;

class AudioSource {
public:
    virtual ~AudioSource() = default;

    /// Called on the capture thread.
    virtual void setInputCallback(AudioCallback callback) = 0;
};

class AudioSink {
public:
    virtual ~AudioSink() = default;

    /// Non-blocking. Samples that do not fit are dropped.
    virtual void queuePlayback(const AudioFrame& frame) = 0;

    /// Discard everything not yet played.
    virtual void clearPlayback() = 0;

    /// Samples queued but not yet played.
    virtual size_t queuedSamples() const = 0;

    virtual int sampleRate() const = 0;
};

} // namespace vtc::audio
