/**
 * Event.cpp - Event and effect names for logging
 */

#include "vtc/core/Event.hpp"
#include "vtc/core/Effect.hpp"

namespace vtc {

namespace {

// Order must follow the variant alternatives.
const char* const EVENT_NAMES[] = {
    "StartRequested",
    "Connected",
    "ConnectFailed",
    "Disconnected",
    "SpeechRecognized",
    "UserInterrupt",
    "VisionPipelineDone",
    "SpeechPlaybackDone",
    "RemoteSpeechStarted",
    "RemoteSpeechStopped",
    "RemoteAudio",
    "RemoteTranscript",
    "RemoteSentence",
    "RemoteEmotion",
    "ManualVisionRequested",
    "CameraOpenFailed",
};

const char* const EFFECT_NAMES[] = {
    "OpenConnection",
    "ScheduleReconnect",
    "SetCapture",
    "SendText",
    "SendControl",
    "OpenCamera",
    "CloseCamera",
    "RunVisionPipeline",
    "CancelVision",
    "StartPlayback",
    "StopPlayback",
    "SpeakNotice",
    "PlayRemoteAudio",
    "ShowText",
};

static_assert(sizeof(EVENT_NAMES) / sizeof(EVENT_NAMES[0]) == std::variant_size_v<Event>);
static_assert(sizeof(EFFECT_NAMES) / sizeof(EFFECT_NAMES[0]) == std::variant_size_v<Effect>);

} // anonymous namespace

const char* eventName(const Event& event) {
    return EVENT_NAMES[event.index()];
}

bool isHighPriority(const Event& event) {
    return std::holds_alternative<events::UserInterrupt>(event);
}

const char* effectName(const Effect& effect) {
    return EFFECT_NAMES[effect.index()];
}

} // namespace vtc
