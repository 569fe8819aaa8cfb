#pragma once

/**
 * TTSEngine.hpp - SpeechSynthesizer backed by an HTTP synthesis server
 */

#include "vtc/tts/SpeechSynthesizer.hpp"

#include <memory>
#include <string>

namespace vtc::tts {

struct TTSOptions {
    std::string server_url = "http://127.0.0.1:5050";
    std::string voice = "default";
    int sample_rate = 16000;        // output rate, server audio is resampled
    int frame_duration_ms = 60;
    int timeout_ms = 15000;
};

class TTSEngine : public SpeechSynthesizer {
public:
    explicit TTSEngine(TTSOptions options);
    ~TTSEngine() override;

    /// GET /health
    bool isHealthy();

    /// Sentences are synthesized one by one as the stream is consumed.
    std::unique_ptr<AudioStream> synthesize(const std::string& text) override;

    int sampleRate() const override;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace vtc::tts
