/**
 * Types.cpp - Value types and enum names
 */

#include "vtc/core/Types.hpp"

#include <cstring>

namespace vtc {

const char* toString(DeviceState state) {
    switch (state) {
        case DeviceState::Idle:       return "Idle";
        case DeviceState::Connecting: return "Connecting";
        case DeviceState::Listening:  return "Listening";
        case DeviceState::Speaking:   return "Speaking";
        case DeviceState::VisionBusy: return "VisionBusy";
    }
    return "Unknown";
}

const char* toString(ErrorKind error) {
    switch (error) {
        case ErrorKind::None:                      return "None";
        case ErrorKind::DeviceUnavailable:         return "DeviceUnavailable";
        case ErrorKind::CaptureFailed:             return "CaptureFailed";
        case ErrorKind::AnalysisNetwork:           return "AnalysisFailed(network)";
        case ErrorKind::AnalysisTimeout:           return "AnalysisFailed(timeout)";
        case ErrorKind::AnalysisMalformedResponse: return "AnalysisFailed(malformedResponse)";
        case ErrorKind::SynthesisFailed:           return "SynthesisFailed";
        case ErrorKind::ConnectionLost:            return "ConnectionLost";
        case ErrorKind::Cancelled:                 return "Cancelled";
    }
    return "Unknown";
}

const char* toString(UtteranceOrigin origin) {
    return origin == UtteranceOrigin::VisionAnswer ? "VisionAnswer" : "UserSpeech";
}

const char* toString(ControlSignal signal) {
    switch (signal) {
        case ControlSignal::StartListening: return "StartListening";
        case ControlSignal::StopListening:  return "StopListening";
        case ControlSignal::Abort:          return "Abort";
    }
    return "Unknown";
}

Utterance::Utterance(std::string text, UtteranceOrigin origin, uint64_t ordinal)
    : text_(std::move(text))
    , origin_(origin)
    , ordinal_(ordinal) {
}

Utterance Utterance::fromInbound(const std::string& text, uint64_t ordinal) {
    const size_t marker_len = std::strlen(VISION_MARKER);
    if (text.compare(0, marker_len, VISION_MARKER) == 0) {
        return Utterance(text.substr(marker_len), UtteranceOrigin::VisionAnswer, ordinal);
    }
    return Utterance(text, UtteranceOrigin::UserSpeech, ordinal);
}

std::string Utterance::outboundText() const {
    if (origin_ == UtteranceOrigin::VisionAnswer) {
        return std::string(VISION_MARKER) + text_;
    }
    return text_;
}

VisionResult VisionResult::ok(std::string text) {
    VisionResult result;
    result.text = std::move(text);
    result.success = true;
    return result;
}

VisionResult VisionResult::failure(ErrorKind error) {
    VisionResult result;
    result.success = false;
    result.error = error;
    return result;
}

std::vector<uint8_t> toPcmBytes(const AudioFrame& frame) {
    std::vector<uint8_t> bytes(frame.size() * 2);
    for (size_t i = 0; i < frame.size(); ++i) {
        uint16_t s = static_cast<uint16_t>(frame[i]);
        bytes[i * 2] = static_cast<uint8_t>(s & 0xFF);
        bytes[i * 2 + 1] = static_cast<uint8_t>(s >> 8);
    }
    return bytes;
}

AudioFrame fromPcmBytes(const std::vector<uint8_t>& bytes) {
    AudioFrame frame(bytes.size() / 2);
    for (size_t i = 0; i < frame.size(); ++i) {
        uint16_t s = static_cast<uint16_t>(bytes[i * 2]) |
                     static_cast<uint16_t>(bytes[i * 2 + 1] << 8);
        frame[i] = static_cast<int16_t>(s);
    }
    return frame;
}

} // namespace vtc
