/**
 * Wav.cpp - Minimal RIFF parser
 */

#include "vtc/audio/Wav.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>

namespace vtc::audio {

namespace {

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

int16_t toInt16(float sample) {
    sample = std::clamp(sample, -1.0f, 1.0f);
    return static_cast<int16_t>(sample * 32767.0f);
}

} // anonymous namespace

std::optional<WavData> decodeWav(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        std::cerr << "[WAV] Not a RIFF/WAVE buffer" << std::endl;
        return std::nullopt;
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    const uint8_t* data = nullptr;
    size_t data_size = 0;

    // Walk the chunks
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        uint32_t size = readU32(chunk + 4);
        size_t body = pos + 8;
        size_t available = bytes.size() - body;

        if (std::memcmp(chunk, "fmt ", 4) == 0 && size >= 16 && available >= 16) {
            format = readU16(chunk + 8);
            channels = readU16(chunk + 10);
            sample_rate = readU32(chunk + 12);
            bits = readU16(chunk + 22);
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            data = bytes.data() + body;
            // Streamed WAVs may carry a placeholder size
            data_size = std::min<size_t>(size, available);
            break;
        }

        pos = body + size + (size & 1);
    }

    if (!data || channels == 0 || sample_rate == 0) {
        std::cerr << "[WAV] Missing fmt or data chunk" << std::endl;
        return std::nullopt;
    }

    const bool is_float = (format == 3 && bits == 32);
    const bool is_pcm = (format == 1 || format == 0xFFFE) && (bits == 16 || bits == 24);
    if (!is_float && !is_pcm) {
        std::cerr << "[WAV] Unsupported format " << format << " / " << bits << " bits" << std::endl;
        return std::nullopt;
    }

    const size_t bytes_per_sample = bits / 8;
    const size_t frame_bytes = bytes_per_sample * channels;
    const size_t frames = data_size / frame_bytes;

    WavData out;
    out.sample_rate = static_cast<int>(sample_rate);
    out.samples.resize(frames);

    for (size_t i = 0; i < frames; ++i) {
        float mix = 0.0f;
        for (uint16_t ch = 0; ch < channels; ++ch) {
            const uint8_t* p = data + i * frame_bytes + ch * bytes_per_sample;
            float sample;
            if (is_float) {
                uint32_t raw = readU32(p);
                std::memcpy(&sample, &raw, sizeof(sample));
            } else if (bits == 24) {
                // Sign-extend 3 bytes
                int32_t val = (p[0] << 8) | (p[1] << 16) | (p[2] << 24);
                val >>= 8;
                sample = static_cast<float>(val) / 8388608.0f;
            } else {
                sample = static_cast<float>(static_cast<int16_t>(readU16(p))) / 32768.0f;
            }
            mix += sample;
        }
        out.samples[i] = toInt16(mix / channels);
    }

    return out;
}

AudioFrame resample(const AudioFrame& samples, int from_rate, int to_rate) {
    if (samples.empty() || from_rate <= 0 || to_rate <= 0 || from_rate == to_rate) {
        return samples;
    }

    double ratio = static_cast<double>(to_rate) / from_rate;
    size_t new_size = static_cast<size_t>(samples.size() * ratio);
    AudioFrame resampled(new_size);

    for (size_t i = 0; i < new_size; i++) {
        double src_pos = i / ratio;
        size_t idx = static_cast<size_t>(src_pos);
        double frac = src_pos - idx;

        if (idx + 1 < samples.size()) {
            // Linear interpolation
            resampled[i] = static_cast<int16_t>(samples[idx] * (1.0 - frac) + samples[idx + 1] * frac);
        } else if (idx < samples.size()) {
            resampled[i] = samples[idx];
        }
    }

    return resampled;
}

} // namespace vtc::audio
