#pragma once

/**
 * SpeechSynthesizer.hpp - Text to a lazy sequence of audio frames
 */

#include "vtc/core/Types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace vtc::tts {

/// One pass over synthesized audio. Frames are produced on demand.
class AudioStream {
public:
    virtual ~AudioStream() = default;

    /// Next frame. False at the end of the sequence or on error.
    virtual bool next(AudioFrame& out) = 0;

    /// SynthesisFailed if the sequence ended early, None otherwise.
    virtual ErrorKind error() const = 0;
};

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    /// Each call starts a new, independent stream from the beginning.
    virtual std::unique_ptr<AudioStream> synthesize(const std::string& text) = 0;

    /// Rate of the produced frames.
    virtual int sampleRate() const = 0;
};

/**
 * Split text at sentence punctuation (Chinese and ASCII).
 * Punctuation stays with its sentence; blank pieces are dropped.
 */
std::vector<std::string> splitSentences(const std::string& text);

} // namespace vtc::tts
