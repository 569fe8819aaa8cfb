#pragma once

/**
 * VADProcessor.hpp - Speech segmentation with libfvad
 */

#include <functional>
#include <memory>
#include <vector>

namespace vtc::audio {

enum class VADMode {
    Quality = 0,
    LowBitrate = 1,
    Aggressive = 2,
    VeryAggressive = 3
};

class VADProcessor {
public:
    /// Complete speech segment (float samples) and its duration.
    using SpeechCallback = std::function<void(const std::vector<float>& segment, int duration_ms)>;

    /// frame_ms must be 10, 20 or 30 (libfvad restriction).
    VADProcessor(int sample_rate = 16000, VADMode mode = VADMode::Aggressive, int frame_ms = 30);
    ~VADProcessor();

    bool isReady() const;

    void process(const float* samples, size_t count);

    void setSpeechCallback(SpeechCallback callback);
    void setSilenceTimeout(int timeout_ms);
    void setMinSpeechDuration(int min_ms);

    /// Drop any partial segment.
    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace vtc::audio
