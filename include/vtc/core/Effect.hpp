#pragma once

/**
 * Effect.hpp - Side effects requested by the state machine
 *
 * The machine never calls a collaborator itself. It returns a list of
 * effects and the Session executes them, in order, on the loop thread
 * (long-running ones are handed to workers).
 */

#include "vtc/core/Types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace vtc {
namespace effects {

struct OpenConnection {};

struct ScheduleReconnect {
    int attempt = 0;
    int delay_ms = 0;
};

/// Gate microphone samples into the recognizer.
struct SetCapture {
    bool enabled = false;
};

struct SendText {
    std::string text;
};

struct SendControl {
    ControlSignal signal = ControlSignal::StopListening;
};

struct OpenCamera {};
struct CloseCamera {};

struct RunVisionPipeline {
    uint64_t episode = 0;
    std::string prompt;
};

struct CancelVision {
    uint64_t episode = 0;
};

struct StartPlayback {
    uint64_t playback = 0;
    std::string text;
    bool upload = false;  // also stream the frames to the remote service
};

struct StopPlayback {};

/// Local-only spoken message (errors, status). Never sent upstream.
struct SpeakNotice {
    std::string text;
};

struct PlayRemoteAudio {
    std::vector<uint8_t> pcm;
};

enum class TextRole {
    User,
    Assistant,
    Vision,
    Emotion
};

struct ShowText {
    TextRole role = TextRole::User;
    std::string text;
};

} // namespace effects

using Effect = std::variant<
    effects::OpenConnection,
    effects::ScheduleReconnect,
    effects::SetCapture,
    effects::SendText,
    effects::SendControl,
    effects::OpenCamera,
    effects::CloseCamera,
    effects::RunVisionPipeline,
    effects::CancelVision,
    effects::StartPlayback,
    effects::StopPlayback,
    effects::SpeakNotice,
    effects::PlayRemoteAudio,
    effects::ShowText
>;

using Effects = std::vector<Effect>;

const char* effectName(const Effect& effect);

} // namespace vtc
