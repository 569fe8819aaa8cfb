#pragma once

/**
 * SpeechRecognizer.hpp - Microphone samples in, recognized text out
 */

#include <cstddef>
#include <functional>
#include <string>

namespace vtc::asr {

class SpeechRecognizer {
public:
    /// Called on the recognizer's own thread, once per utterance.
    using ResultCallback = std::function<void(const std::string& text)>;

    virtual ~SpeechRecognizer() = default;

    virtual void setResultCallback(ResultCallback callback) = 0;

    /// Mono float32 samples at the session rate. Called on the capture thread.
    virtual void feed(const float* samples, size_t count) = 0;

    /// Drop partial and pending utterances.
    virtual void reset() = 0;
};

} // namespace vtc::asr
