#pragma once

/**
 * Session.hpp - Wires the collaborators to the event loop
 *
 * The Session owns the state machine and the scheduler. Adapter callbacks
 * become events; the machine's effects become adapter calls.
 */

#include "vtc/core/Event.hpp"
#include "vtc/core/Types.hpp"

#include <functional>
#include <memory>
#include <string>

namespace vtc {

namespace config { struct AppConfig; }
namespace protocol { class ProtocolClient; }
namespace camera { class CameraController; }
namespace vision { class VisionAnalyzer; }
namespace tts { class SpeechSynthesizer; }
namespace asr { class SpeechRecognizer; }
namespace audio { class AudioSource; class AudioSink; }

struct SessionComponents {
    std::unique_ptr<protocol::ProtocolClient> protocol;
    std::unique_ptr<camera::CameraController> camera;       // null: no camera
    std::unique_ptr<vision::VisionAnalyzer> analyzer;       // null: vision unavailable
    std::unique_ptr<tts::SpeechSynthesizer> synthesizer;
    std::shared_ptr<audio::AudioSink> speaker;
    std::shared_ptr<audio::AudioSource> microphone;         // null in text mode
    std::unique_ptr<asr::SpeechRecognizer> recognizer;      // null in text mode
};

/// Invoked on the event loop thread. Keep them short.
struct SessionCallbacks {
    std::function<void(DeviceState from, DeviceState to)> onStateChange;
    std::function<void(const std::string& text)> onUserUtterance;
    std::function<void(const std::string& text)> onAssistantText;
    std::function<void(const std::string& text)> onNotice;
};

class Session {
public:
    /**
     * Build the one Session of the process.
     * @return nullptr if a Session already exists or a required component
     *         (protocol, synthesizer, speaker) is missing
     */
    static std::unique_ptr<Session> create(const config::AppConfig& config,
                                           SessionComponents components);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Start the event loop and connect.
    bool start();

    /// Release the camera, close the connection and join every worker.
    void stop();

    bool isRunning() const;

    void post(Event event);

    /// Stop speaking / abandon vision now.
    void interrupt();

    /// Typed input, handled like recognized speech.
    void submitText(const std::string& text);

    /// Empty prompt uses the configured default.
    void requestVision(const std::string& prompt = {});

    DeviceState state() const;

    void setCallbacks(SessionCallbacks callbacks);

private:
    Session();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vtc
