#pragma once

/**
 * Types.hpp - Shared value types of the VisionTalk session core
 */

#include <cstdint>
#include <string>
#include <vector>

namespace vtc {

/// Literal prefix carried by every vision answer sent to the remote service.
inline constexpr const char* VISION_MARKER = "Vision Analysis: ";

enum class DeviceState {
    Idle,
    Connecting,
    Listening,
    Speaking,
    VisionBusy
};

enum class ErrorKind {
    None,
    DeviceUnavailable,
    CaptureFailed,
    AnalysisNetwork,
    AnalysisTimeout,
    AnalysisMalformedResponse,
    SynthesisFailed,
    ConnectionLost,
    Cancelled
};

enum class UtteranceOrigin {
    UserSpeech,
    VisionAnswer
};

enum class ControlSignal {
    StartListening,
    StopListening,
    Abort
};

const char* toString(DeviceState state);
const char* toString(ErrorKind error);
const char* toString(UtteranceOrigin origin);
const char* toString(ControlSignal signal);

/**
 * One piece of recognized or synthesized text.
 *
 * Immutable once created. The origin tag decides whether the text may
 * ever be scanned for keywords: VisionAnswer utterances never are.
 */
class Utterance {
public:
    Utterance(std::string text, UtteranceOrigin origin, uint64_t ordinal);

    /**
     * Build an utterance from text that arrived from outside (remote
     * transcript, typed input). Text carrying VISION_MARKER is an echo of
     * one of our own vision answers: the marker is stripped and the origin
     * set to VisionAnswer.
     */
    static Utterance fromInbound(const std::string& text, uint64_t ordinal);

    const std::string& text() const { return text_; }
    UtteranceOrigin origin() const { return origin_; }
    uint64_t ordinal() const { return ordinal_; }
    bool isVisionAnswer() const { return origin_ == UtteranceOrigin::VisionAnswer; }

    /// Text as it goes on the wire (marker prepended for vision answers).
    std::string outboundText() const;

private:
    std::string text_;
    UtteranceOrigin origin_;
    uint64_t ordinal_;
};

/// Encoded camera frame (JPEG).
struct Frame {
    std::vector<uint8_t> jpeg;
    int width = 0;
    int height = 0;

    bool empty() const { return jpeg.empty(); }
};

/// Frame plus prompt handed to the analyzer. Not kept after the call.
struct VisionRequest {
    Frame frame;
    std::string prompt;
};

struct VisionResult {
    std::string text;
    bool success = false;
    ErrorKind error = ErrorKind::None;

    static VisionResult ok(std::string text);
    static VisionResult failure(ErrorKind error);
};

struct CameraHandle {
    int index = -1;
    uint64_t generation = 0;

    bool operator==(const CameraHandle& other) const {
        return index == other.index && generation == other.generation;
    }
    bool operator!=(const CameraHandle& other) const { return !(*this == other); }
};

struct CaptureResult {
    bool ok = false;
    Frame frame;
    ErrorKind error = ErrorKind::None;
};

/// Mono 16-bit PCM samples at the session sample rate.
using AudioFrame = std::vector<int16_t>;

/// Little-endian byte view of a PCM frame, as sent over the wire.
std::vector<uint8_t> toPcmBytes(const AudioFrame& frame);
AudioFrame fromPcmBytes(const std::vector<uint8_t>& bytes);

} // namespace vtc
