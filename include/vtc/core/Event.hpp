#pragma once

/**
 * Event.hpp - Everything that can happen to a session
 *
 * Producers (network, recognizer, workers, console) never touch the state
 * machine directly; they post one of these to the EventScheduler.
 */

#include "vtc/core/Types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace vtc {
namespace events {

struct StartRequested {};

struct Connected {
    std::string session_id;
};

struct ConnectFailed {
    std::string reason;
};

struct Disconnected {
    ErrorKind reason = ErrorKind::ConnectionLost;
};

struct SpeechRecognized {
    Utterance utterance;
};

struct UserInterrupt {};

struct VisionPipelineDone {
    uint64_t episode = 0;
    VisionResult result;
};

struct SpeechPlaybackDone {
    uint64_t playback = 0;
    ErrorKind error = ErrorKind::None;
};

// Server side TTS turn ("tts" start/stop)
struct RemoteSpeechStarted {};
struct RemoteSpeechStopped {};

struct RemoteAudio {
    std::vector<uint8_t> pcm;
};

struct RemoteTranscript {
    Utterance utterance;
};

struct RemoteSentence {
    std::string text;
};

struct RemoteEmotion {
    std::string emotion;
};

struct ManualVisionRequested {
    std::string prompt;
};

struct CameraOpenFailed {
    std::string reason;
};

} // namespace events

using Event = std::variant<
    events::StartRequested,
    events::Connected,
    events::ConnectFailed,
    events::Disconnected,
    events::SpeechRecognized,
    events::UserInterrupt,
    events::VisionPipelineDone,
    events::SpeechPlaybackDone,
    events::RemoteSpeechStarted,
    events::RemoteSpeechStopped,
    events::RemoteAudio,
    events::RemoteTranscript,
    events::RemoteSentence,
    events::RemoteEmotion,
    events::ManualVisionRequested,
    events::CameraOpenFailed
>;

const char* eventName(const Event& event);

/// Interrupts jump ahead of everything already queued.
bool isHighPriority(const Event& event);

} // namespace vtc
