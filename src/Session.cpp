/**
 * Session.cpp - Event loop, effect execution and collaborator wiring
 *
 *   microphone -> recognizer ─┐
 *   protocol (ws) ────────────┼─> EventScheduler -> SessionStateMachine
 *   camera / vision workers ──┤                            │
 *   speech player ────────────┘          effects <─────────┘
 */

#include "vtc/Session.hpp"
#include "vtc/asr/SpeechRecognizer.hpp"
#include "vtc/audio/AudioIO.hpp"
#include "vtc/camera/CameraController.hpp"
#include "vtc/config/Config.hpp"
#include "vtc/core/EventScheduler.hpp"
#include "vtc/core/SessionStateMachine.hpp"
#include "vtc/core/TaskWorker.hpp"
#include "vtc/protocol/Messages.hpp"
#include "vtc/protocol/ProtocolClient.hpp"
#include "vtc/tts/SpeechPlayer.hpp"
#include "vtc/tts/SpeechSynthesizer.hpp"
#include "vtc/vision/VisionAnalyzer.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <variant>

namespace vtc {

namespace {

std::mutex g_instance_mutex;
bool g_instance_exists = false;

} // anonymous namespace

struct Session::Impl {
    SessionComponents parts;
    std::chrono::milliseconds vision_timeout{10000};

    std::unique_ptr<SessionStateMachine> machine;
    std::unique_ptr<EventScheduler> scheduler;
    std::unique_ptr<tts::SpeechPlayer> player;
    TaskWorker camera_worker{"camera"};
    TaskWorker vision_worker{"vision"};

    std::atomic<DeviceState> state{DeviceState::Idle};
    std::atomic<bool> running{false};
    std::atomic<bool> capture_enabled{false};
    std::atomic<uint64_t> ordinal{0};

    // Cancel flag of the episode currently owned by the vision worker
    std::shared_ptr<std::atomic<bool>> vision_cancel;

    std::mutex callback_mutex;
    SessionCallbacks callbacks;

    void post(Event event) {
        scheduler->post(std::move(event));
    }

    void dispatch(const Event& event) {
        Effects effects = machine->handle(event);
        for (const Effect& effect : effects) {
            std::visit([this](const auto& e) { run(e); }, effect);
        }
    }

    void onStateChange(DeviceState from, DeviceState to) {
        state = to;
        std::cout << "[Session] State: " << toString(from) << " -> " << toString(to) << std::endl;
        std::lock_guard<std::mutex> lock(callback_mutex);
        if (callbacks.onStateChange) callbacks.onStateChange(from, to);
    }

    void notify(std::function<void(const std::string&)> SessionCallbacks::*which,
                const std::string& text) {
        std::lock_guard<std::mutex> lock(callback_mutex);
        const auto& cb = callbacks.*which;
        if (cb) cb(text);
    }

    // ------------------------------------------------------------------------
    // Inputs
    // ------------------------------------------------------------------------

    void onMicrophone(const float* samples, size_t count) {
        if (!capture_enabled || !parts.recognizer) return;
        // A local notice must not be transcribed as user speech
        if (player->isActive()) return;
        parts.recognizer->feed(samples, count);
    }

    void wireInputs() {
        protocol::ProtocolCallbacks cbs;
        cbs.onConnected = [this](const std::string& session_id) {
            post(events::Connected{session_id});
        };
        cbs.onConnectFailed = [this](const std::string& reason) {
            post(events::ConnectFailed{reason});
        };
        cbs.onDisconnected = [this](ErrorKind reason) {
            post(events::Disconnected{reason});
        };
        cbs.onMessage = [this](const protocol::InboundMessage& message) {
            if (auto event = protocol::toEvent(message)) {
                post(std::move(*event));
            }
        };
        cbs.onAudio = [this](std::vector<uint8_t> pcm) {
            post(events::RemoteAudio{std::move(pcm)});
        };
        parts.protocol->setCallbacks(std::move(cbs));

        player->setFinishedCallback([this](uint64_t playback, ErrorKind error) {
            post(events::SpeechPlaybackDone{playback, error});
        });
        player->setUploadCallback([this](const AudioFrame& frame) {
            parts.protocol->sendAudioChunk(toPcmBytes(frame));
        });

        if (parts.recognizer) {
            parts.recognizer->setResultCallback([this](const std::string& text) {
                Utterance u(text, UtteranceOrigin::UserSpeech, ++ordinal);
                post(events::SpeechRecognized{std::move(u)});
            });
        }
        if (parts.microphone) {
            parts.microphone->setInputCallback([this](const float* samples, size_t count) {
                onMicrophone(samples, count);
            });
        }
    }

    void unwireInputs() {
        if (parts.microphone) parts.microphone->setInputCallback(nullptr);
        if (parts.recognizer) parts.recognizer->setResultCallback(nullptr);
        player->setFinishedCallback(nullptr);
        player->setUploadCallback(nullptr);
        parts.protocol->setCallbacks({});
    }

    // ------------------------------------------------------------------------
    // Effects
    // ------------------------------------------------------------------------

    void run(const effects::OpenConnection&) {
        parts.protocol->connect();
    }

    void run(const effects::ScheduleReconnect& e) {
        std::cout << "[Session] Reconnect attempt " << e.attempt << " in "
                  << e.delay_ms << " ms" << std::endl;
        scheduler->postDelayed(events::StartRequested{}, std::chrono::milliseconds(e.delay_ms));
    }

    void run(const effects::SetCapture& e) {
        capture_enabled = e.enabled;
        if (!e.enabled && parts.recognizer) {
            parts.recognizer->reset();
        }
    }

    void run(const effects::SendText& e) {
        if (!parts.protocol->sendText(e.text)) {
            std::cerr << "[Session] Text not sent (not connected)" << std::endl;
        }
    }

    void run(const effects::SendControl& e) {
        if (!parts.protocol->sendControl(e.signal)) {
            std::cerr << "[Session] Control " << toString(e.signal) << " not sent" << std::endl;
        }
    }

    void run(const effects::OpenCamera&) {
        if (!parts.camera) {
            post(events::CameraOpenFailed{"no camera configured"});
            return;
        }
        camera_worker.submit([this]() {
            if (!parts.camera->open()) {
                post(events::CameraOpenFailed{parts.camera->lastError()});
            }
        });
    }

    void run(const effects::CloseCamera&) {
        if (!parts.camera) return;
        camera_worker.submit([this]() { parts.camera->close(); });
    }

    void run(const effects::RunVisionPipeline& e) {
        uint64_t episode = e.episode;
        if (!parts.camera || !parts.analyzer) {
            post(events::VisionPipelineDone{episode, VisionResult::failure(ErrorKind::DeviceUnavailable)});
            return;
        }

        auto cancel = std::make_shared<std::atomic<bool>>(false);
        vision_cancel = cancel;
        std::string prompt = e.prompt;

        vision_worker.submit([this, episode, prompt, cancel]() {
            std::cout << "[Session] Vision episode " << episode << ": capturing" << std::endl;
            CaptureResult capture = parts.camera->captureFrame(cancel.get());

            VisionResult result;
            if (*cancel) {
                result = VisionResult::failure(ErrorKind::Cancelled);
            } else if (!capture.ok) {
                result = VisionResult::failure(capture.error);
            } else {
                VisionRequest request{std::move(capture.frame), prompt};
                result = parts.analyzer->analyze(request, vision_timeout, cancel.get());
            }

            std::cout << "[Session] Vision episode " << episode << " done: "
                      << (result.success ? "ok" : toString(result.error)) << std::endl;
            post(events::VisionPipelineDone{episode, std::move(result)});
        });
    }

    void run(const effects::CancelVision& e) {
        if (vision_cancel) {
            *vision_cancel = true;
            vision_cancel.reset();
        }
        size_t dropped = vision_worker.cancelPending();
        std::cout << "[Session] Vision episode " << e.episode << " cancelled";
        if (dropped > 0) std::cout << " (" << dropped << " queued job dropped)";
        std::cout << std::endl;
    }

    void run(const effects::StartPlayback& e) {
        player->play(e.playback, e.text, e.upload);
    }

    void run(const effects::StopPlayback&) {
        player->stop();
    }

    void run(const effects::SpeakNotice& e) {
        std::cout << "[Session] Notice: " << e.text << std::endl;
        player->speakNotice(e.text);
        notify(&SessionCallbacks::onNotice, e.text);
    }

    void run(const effects::PlayRemoteAudio& e) {
        parts.speaker->queuePlayback(fromPcmBytes(e.pcm));
    }

    void run(const effects::ShowText& e) {
        switch (e.role) {
            case effects::TextRole::User:
                notify(&SessionCallbacks::onUserUtterance, e.text);
                break;
            case effects::TextRole::Assistant:
            case effects::TextRole::Vision:
                notify(&SessionCallbacks::onAssistantText, e.text);
                break;
            case effects::TextRole::Emotion:
                std::cout << "[Session] Emotion: " << e.text << std::endl;
                break;
        }
    }
};

Session::Session() : impl_(std::make_unique<Impl>()) {}

std::unique_ptr<Session> Session::create(const config::AppConfig& config,
                                         SessionComponents components) {
    if (!components.protocol || !components.synthesizer || !components.speaker) {
        std::cerr << "[Session] Missing protocol, synthesizer or speaker" << std::endl;
        return nullptr;
    }

    {
        std::lock_guard<std::mutex> lock(g_instance_mutex);
        if (g_instance_exists) {
            std::cerr << "[Session] A session already exists" << std::endl;
            return nullptr;
        }
        g_instance_exists = true;
    }

    std::unique_ptr<Session> session(new Session());
    Impl& impl = *session->impl_;
    impl.parts = std::move(components);
    impl.vision_timeout = std::chrono::milliseconds(config.vision.timeout_ms);

    KeywordLists lists = config.keywordLists();
    if (lists.vision_enabled && (!impl.parts.camera || !impl.parts.analyzer)) {
        std::cerr << "[Session] Vision disabled: no camera or analyzer" << std::endl;
        lists.vision_enabled = false;
    }

    MachineOptions options;
    options.default_prompt = config.vision.default_prompt;
    options.upload_vision_audio = config.tts.upload_vision_audio;
    options.reconnect_max_attempts = config.system.reconnect_max_attempts;
    options.reconnect_delay_ms = config.system.reconnect_delay_ms;

    impl.machine = std::make_unique<SessionStateMachine>(KeywordMatcher(std::move(lists)), options);
    impl.machine->setStateListener([&impl](DeviceState from, DeviceState to) {
        impl.onStateChange(from, to);
    });
    impl.scheduler = std::make_unique<EventScheduler>([&impl](const Event& event) {
        impl.dispatch(event);
    });
    impl.player = std::make_unique<tts::SpeechPlayer>(*impl.parts.synthesizer, *impl.parts.speaker);

    return session;
}

Session::~Session() {
    stop();
    std::lock_guard<std::mutex> lock(g_instance_mutex);
    g_instance_exists = false;
}

bool Session::start() {
    if (impl_->running) return true;

    std::cout << "[Session] Starting..." << std::endl;
    impl_->wireInputs();
    impl_->running = true;
    impl_->scheduler->start();
    impl_->post(events::StartRequested{});
    return true;
}

void Session::stop() {
    if (!impl_->running.exchange(false)) return;

    std::cout << "[Session] Stopping..." << std::endl;
    impl_->capture_enabled = false;
    impl_->unwireInputs();
    impl_->scheduler->stop();

    if (impl_->vision_cancel) *impl_->vision_cancel = true;
    impl_->vision_worker.cancelPending();
    impl_->vision_worker.shutdown();
    impl_->camera_worker.cancelPending();
    impl_->camera_worker.shutdown();

    impl_->player->stop();
    if (impl_->parts.camera) impl_->parts.camera->close();
    impl_->parts.protocol->disconnect();
    std::cout << "[Session] Stopped" << std::endl;
}

bool Session::isRunning() const {
    return impl_->running;
}

void Session::post(Event event) {
    impl_->post(std::move(event));
}

void Session::interrupt() {
    impl_->post(events::UserInterrupt{});
}

void Session::submitText(const std::string& text) {
    // Typed text may carry the vision marker, same as a remote transcript
    Utterance u = Utterance::fromInbound(text, ++impl_->ordinal);
    impl_->post(events::SpeechRecognized{std::move(u)});
}

void Session::requestVision(const std::string& prompt) {
    impl_->post(events::ManualVisionRequested{prompt});
}

DeviceState Session::state() const {
    return impl_->state;
}

void Session::setCallbacks(SessionCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->callbacks = std::move(callbacks);
}

} // namespace vtc
