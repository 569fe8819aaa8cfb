#pragma once

/**
 * Wav.hpp - WAV decoding and resampling for synthesized speech
 */

#include "vtc/core/Types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace vtc::audio {

struct WavData {
    AudioFrame samples;   // mono int16
    int sample_rate = 0;
};

/**
 * Decode a RIFF/WAVE buffer with 16-bit, 24-bit PCM or 32-bit float samples.
 * Multi-channel input is mixed down to mono.
 */
std::optional<WavData> decodeWav(const std::vector<uint8_t>& bytes);

/// Linear interpolation resampler.
AudioFrame resample(const AudioFrame& samples, int from_rate, int to_rate);

} // namespace vtc::audio
