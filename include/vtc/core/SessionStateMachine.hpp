#pragma once

/**
 * SessionStateMachine.hpp - Device state and the (state, event) decision table
 *
 * handle() is the only way DeviceState changes. It is called from the
 * EventScheduler loop only and returns the effects the Session must run.
 */

#include "vtc/core/Effect.hpp"
#include "vtc/core/Event.hpp"
#include "vtc/core/KeywordMatcher.hpp"
#include "vtc/core/Types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace vtc {

struct MachineOptions {
    std::string default_prompt;
    bool upload_vision_audio = true;
    int reconnect_max_attempts = 3;
    int reconnect_delay_ms = 2000;
};

class SessionStateMachine {
public:
    using StateListener = std::function<void(DeviceState from, DeviceState to)>;

    SessionStateMachine(KeywordMatcher matcher, MachineOptions options);

    /**
     * Apply one event.
     * Combinations that make no sense in the current state are logged and
     * produce no effects. Never re-entrant: a nested call is rejected.
     */
    Effects handle(const Event& event);

    DeviceState state() const { return state_; }

    /// Id of the vision episode that owns VisionBusy, 0 when none.
    uint64_t activeEpisode() const { return episode_; }

    /// Id of the local synthesis being played, 0 when none.
    uint64_t activePlayback() const { return playback_; }

    bool remoteVoiceActive() const { return remote_voice_; }

    int reconnectAttempts() const { return reconnect_attempts_; }

    const KeywordMatcher& matcher() const { return matcher_; }

    void setStateListener(StateListener listener);

    /// Spoken summary of a failure category, used for notices.
    static std::string noticeFor(ErrorKind error);

private:
    void on(const events::StartRequested& e, Effects& out);
    void on(const events::Connected& e, Effects& out);
    void on(const events::ConnectFailed& e, Effects& out);
    void on(const events::Disconnected& e, Effects& out);
    void on(const events::SpeechRecognized& e, Effects& out);
    void on(const events::UserInterrupt& e, Effects& out);
    void on(const events::VisionPipelineDone& e, Effects& out);
    void on(const events::SpeechPlaybackDone& e, Effects& out);
    void on(const events::RemoteSpeechStarted& e, Effects& out);
    void on(const events::RemoteSpeechStopped& e, Effects& out);
    void on(const events::RemoteAudio& e, Effects& out);
    void on(const events::RemoteTranscript& e, Effects& out);
    void on(const events::RemoteSentence& e, Effects& out);
    void on(const events::RemoteEmotion& e, Effects& out);
    void on(const events::ManualVisionRequested& e, Effects& out);
    void on(const events::CameraOpenFailed& e, Effects& out);

    void transition(DeviceState next, Effects& out);
    void beginEpisode(const std::string& prompt, Effects& out);
    void deliverVisionAnswer(const Utterance& answer, Effects& out);
    void silence(Effects& out);
    void scheduleReconnect(Effects& out);
    void ignore(const char* event_name) const;

    KeywordMatcher matcher_;
    MachineOptions options_;
    StateListener listener_;

    DeviceState state_ = DeviceState::Idle;
    bool handling_ = false;

    uint64_t episode_ = 0;
    uint64_t episode_counter_ = 0;
    uint64_t playback_ = 0;
    uint64_t playback_counter_ = 0;
    uint64_t last_ordinal_ = 0;
    bool remote_voice_ = false;
    std::vector<std::vector<uint8_t>> held_remote_;  // remote frames queued behind local playback
    int reconnect_attempts_ = 0;
};

} // namespace vtc
