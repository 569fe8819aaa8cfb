#pragma once

/**
 * WhisperRecognizer.hpp - libfvad segmentation + whisper.cpp transcription
 */

#include "vtc/asr/SpeechRecognizer.hpp"

#include <memory>
#include <string>

namespace vtc::asr {

struct WhisperOptions {
    std::string model_path;
    std::string language = "zh";
    int threads = 4;
    int sample_rate = 16000;
    int vad_mode = 2;
    int silence_timeout_ms = 800;
    int min_speech_ms = 300;
};

class WhisperRecognizer : public SpeechRecognizer {
public:
    explicit WhisperRecognizer(const WhisperOptions& options);
    ~WhisperRecognizer() override;

    /// False when the model or the VAD could not be loaded.
    bool isReady() const;

    void setResultCallback(ResultCallback callback) override;
    void feed(const float* samples, size_t count) override;
    void reset() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vtc::asr
