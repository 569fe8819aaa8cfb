#pragma once

/**
 * SpeechPlayer.hpp - Plays synthesized text on the speaker
 *
 * Runs synthesis and playback on its own thread. Vision answers may also
 * be uploaded frame by frame; notices are local only.
 */

#include "vtc/audio/AudioIO.hpp"
#include "vtc/tts/SpeechSynthesizer.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace vtc::tts {

struct SpeechPlayerOptions {
    int max_queued_ms = 300;    // how far ahead of the speaker we synthesize
    int poll_ms = 10;
};

class SpeechPlayer {
public:
    /// Fired once per play() that ran to completion (not after stop()).
    using FinishedCallback = std::function<void(uint64_t playback, ErrorKind error)>;
    using UploadCallback = std::function<void(const AudioFrame& frame)>;

    SpeechPlayer(SpeechSynthesizer& synthesizer, audio::AudioSink& sink,
                 SpeechPlayerOptions options = {});
    ~SpeechPlayer();

    SpeechPlayer(const SpeechPlayer&) = delete;
    SpeechPlayer& operator=(const SpeechPlayer&) = delete;

    void setFinishedCallback(FinishedCallback callback);
    void setUploadCallback(UploadCallback callback);

    /// Queue text behind whatever is playing. playback must be non-zero.
    void play(uint64_t playback, const std::string& text, bool upload);

    /// Local spoken notice, never uploaded and never reported.
    void speakNotice(const std::string& text);

    /**
     * Abort everything queued or playing and flush the speaker.
     * Once this returns no further frame reaches the sink or the upload
     * callback for the aborted work.
     */
    void stop();

    /// True while anything is queued, synthesizing, or draining.
    bool isActive() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vtc::tts
