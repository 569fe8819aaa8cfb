/**
 * SessionStateMachine.cpp - Transition table
 */

#include "vtc/core/SessionStateMachine.hpp"

#include <algorithm>
#include <iostream>

namespace vtc {

namespace {

const char* NOTICE_NOT_CONNECTED = "尚未连接到服务器";
const char* NOTICE_CONNECT_FAILED = "无法连接到服务器";
const char* NOTICE_VISION_DISABLED = "视觉功能未启用";

} // anonymous namespace

SessionStateMachine::SessionStateMachine(KeywordMatcher matcher, MachineOptions options)
    : matcher_(std::move(matcher))
    , options_(std::move(options)) {
}

void SessionStateMachine::setStateListener(StateListener listener) {
    listener_ = std::move(listener);
}

std::string SessionStateMachine::noticeFor(ErrorKind error) {
    switch (error) {
        case ErrorKind::DeviceUnavailable:         return "摄像头无法打开，请检查摄像头连接";
        case ErrorKind::CaptureFailed:             return "无法获取摄像头画面";
        case ErrorKind::AnalysisNetwork:           return "图像分析服务连接失败";
        case ErrorKind::AnalysisTimeout:           return "图像分析超时";
        case ErrorKind::AnalysisMalformedResponse: return "图像分析结果无法识别";
        case ErrorKind::ConnectionLost:            return "与服务器的连接已断开";
        default:                                   return "图像分析失败";
    }
}

Effects SessionStateMachine::handle(const Event& event) {
    Effects out;

    if (handling_) {
        std::cerr << "[StateMachine] Nested handle() rejected: "
                  << eventName(event) << std::endl;
        return out;
    }

    handling_ = true;
    std::visit([&](const auto& e) { on(e, out); }, event);
    handling_ = false;

    return out;
}

// ============================================================================
// Helpers
// ============================================================================

void SessionStateMachine::transition(DeviceState next, Effects& out) {
    if (next == state_) return;

    DeviceState prev = state_;

    if (prev == DeviceState::Listening) {
        out.push_back(effects::SetCapture{false});
    }

    state_ = next;

    if (next == DeviceState::Listening) {
        out.push_back(effects::SetCapture{true});
        out.push_back(effects::SendControl{ControlSignal::StartListening});
    }

    std::cout << "[StateMachine] " << toString(prev) << " -> " << toString(next) << std::endl;

    if (listener_) {
        listener_(prev, next);
    }
}

void SessionStateMachine::beginEpisode(const std::string& prompt, Effects& out) {
    out.push_back(effects::SendControl{ControlSignal::StopListening});
    episode_ = ++episode_counter_;
    transition(DeviceState::VisionBusy, out);
    out.push_back(effects::RunVisionPipeline{episode_, prompt});

    std::cout << "[StateMachine] Vision episode " << episode_ << " started" << std::endl;
}

void SessionStateMachine::deliverVisionAnswer(const Utterance& answer, Effects& out) {
    out.push_back(effects::SendText{answer.outboundText()});
    out.push_back(effects::ShowText{effects::TextRole::Vision, answer.text()});

    playback_ = ++playback_counter_;
    out.push_back(effects::StartPlayback{playback_, answer.text(), options_.upload_vision_audio});
}

void SessionStateMachine::silence(Effects& out) {
    if (remote_voice_) {
        out.push_back(effects::SendControl{ControlSignal::Abort});
    }
    out.push_back(effects::StopPlayback{});
    playback_ = 0;
    remote_voice_ = false;
    held_remote_.clear();
}

void SessionStateMachine::scheduleReconnect(Effects& out) {
    if (reconnect_attempts_ < options_.reconnect_max_attempts) {
        ++reconnect_attempts_;
        std::cout << "[StateMachine] Reconnect attempt " << reconnect_attempts_ << "/"
                  << options_.reconnect_max_attempts << " in "
                  << options_.reconnect_delay_ms << " ms" << std::endl;
        out.push_back(effects::ScheduleReconnect{reconnect_attempts_, options_.reconnect_delay_ms});
        return;
    }

    std::cerr << "[StateMachine] Giving up after " << reconnect_attempts_
              << " reconnect attempts" << std::endl;
    out.push_back(effects::SpeakNotice{NOTICE_CONNECT_FAILED});
}

void SessionStateMachine::ignore(const char* event_name) const {
    std::cout << "[StateMachine] Ignoring " << event_name << " in "
              << toString(state_) << std::endl;
}

// ============================================================================
// Connection
// ============================================================================

void SessionStateMachine::on(const events::StartRequested&, Effects& out) {
    if (state_ != DeviceState::Idle) {
        ignore("StartRequested");
        return;
    }
    transition(DeviceState::Connecting, out);
    out.push_back(effects::OpenConnection{});
}

void SessionStateMachine::on(const events::Connected& e, Effects& out) {
    if (state_ != DeviceState::Idle && state_ != DeviceState::Connecting) {
        ignore("Connected");
        return;
    }
    std::cout << "[StateMachine] Session " << (e.session_id.empty() ? "(none)" : e.session_id)
              << " established" << std::endl;
    reconnect_attempts_ = 0;
    transition(DeviceState::Listening, out);
}

void SessionStateMachine::on(const events::ConnectFailed& e, Effects& out) {
    if (state_ != DeviceState::Connecting) {
        ignore("ConnectFailed");
        return;
    }
    std::cerr << "[StateMachine] Connect failed: " << e.reason << std::endl;
    transition(DeviceState::Idle, out);
    scheduleReconnect(out);
}

void SessionStateMachine::on(const events::Disconnected& e, Effects& out) {
    if (state_ == DeviceState::Idle) {
        ignore("Disconnected");
        return;
    }

    std::cerr << "[StateMachine] Disconnected (" << toString(e.reason) << ")" << std::endl;

    if (episode_ != 0) {
        out.push_back(effects::CancelVision{episode_});
        episode_ = 0;
    }
    if (playback_ != 0 || remote_voice_) {
        out.push_back(effects::StopPlayback{});
        playback_ = 0;
        remote_voice_ = false;
    }
    held_remote_.clear();
    out.push_back(effects::CloseCamera{});

    transition(DeviceState::Idle, out);

    if (e.reason == ErrorKind::ConnectionLost) {
        out.push_back(effects::SpeakNotice{noticeFor(ErrorKind::ConnectionLost)});
        scheduleReconnect(out);
    }
}

// ============================================================================
// Speech
// ============================================================================

void SessionStateMachine::on(const events::SpeechRecognized& e, Effects& out) {
    const Utterance& u = e.utterance;
    last_ordinal_ = std::max(last_ordinal_, u.ordinal());

    if (u.isVisionAnswer()) {
        // Forwarded as-is, never classified
        if (state_ == DeviceState::Listening || state_ == DeviceState::Speaking) {
            out.push_back(effects::SendText{u.outboundText()});
            out.push_back(effects::ShowText{effects::TextRole::Vision, u.text()});
        } else {
            ignore("SpeechRecognized(VisionAnswer)");
        }
        return;
    }

    if (state_ != DeviceState::Listening && state_ != DeviceState::Idle) {
        ignore("SpeechRecognized");
        return;
    }

    KeywordMatch m = matcher_.match(u);

    switch (m.intent) {
        case Intent::CameraOpen:
            std::cout << "[StateMachine] Camera open command (\"" << m.keyword << "\")" << std::endl;
            out.push_back(effects::OpenCamera{});
            return;

        case Intent::CameraClose:
            std::cout << "[StateMachine] Camera close command (\"" << m.keyword << "\")" << std::endl;
            out.push_back(effects::CloseCamera{});
            return;

        case Intent::VisionTrigger:
            if (state_ != DeviceState::Listening) {
                std::cout << "[StateMachine] Vision trigger while not connected" << std::endl;
                out.push_back(effects::SpeakNotice{NOTICE_NOT_CONNECTED});
                return;
            }
            std::cout << "[StateMachine] Vision trigger (\"" << m.keyword << "\")" << std::endl;
            out.push_back(effects::ShowText{effects::TextRole::User, u.text()});
            beginEpisode(options_.default_prompt, out);
            return;

        case Intent::Ordinary:
            if (state_ != DeviceState::Listening) {
                ignore("SpeechRecognized");
                return;
            }
            out.push_back(effects::SendText{u.text()});
            out.push_back(effects::ShowText{effects::TextRole::User, u.text()});
            return;
    }
}

void SessionStateMachine::on(const events::UserInterrupt&, Effects& out) {
    switch (state_) {
        case DeviceState::Listening:
            silence(out);
            return;

        case DeviceState::Speaking:
            silence(out);
            transition(DeviceState::Listening, out);
            return;

        case DeviceState::VisionBusy:
            out.push_back(effects::CancelVision{episode_});
            std::cout << "[StateMachine] Vision episode " << episode_ << " cancelled" << std::endl;
            episode_ = 0;
            silence(out);
            transition(DeviceState::Listening, out);
            return;

        default:
            ignore("UserInterrupt");
            return;
    }
}

void SessionStateMachine::on(const events::SpeechPlaybackDone& e, Effects& out) {
    if (e.playback == 0 || e.playback != playback_) {
        std::cout << "[StateMachine] Discarding stale playback completion ("
                  << e.playback << ")" << std::endl;
        return;
    }

    playback_ = 0;
    if (e.error != ErrorKind::None) {
        std::cerr << "[StateMachine] Playback ended with " << toString(e.error) << std::endl;
    }

    // Remote speech that started during the local answer plays after it
    if (!held_remote_.empty()) {
        std::cout << "[StateMachine] Releasing " << held_remote_.size()
                  << " held remote audio frames" << std::endl;
        for (auto& pcm : held_remote_) {
            out.push_back(effects::PlayRemoteAudio{std::move(pcm)});
        }
        held_remote_.clear();
    }

    if (state_ == DeviceState::Speaking && !remote_voice_) {
        transition(DeviceState::Listening, out);
    }
}

// ============================================================================
// Vision
// ============================================================================

void SessionStateMachine::on(const events::VisionPipelineDone& e, Effects& out) {
    if (state_ != DeviceState::VisionBusy || e.episode != episode_) {
        std::cout << "[StateMachine] Discarding stale vision result (episode "
                  << e.episode << ")" << std::endl;
        return;
    }

    episode_ = 0;

    if (e.result.success) {
        Utterance answer(e.result.text, UtteranceOrigin::VisionAnswer, ++last_ordinal_);
        deliverVisionAnswer(answer, out);
        transition(DeviceState::Speaking, out);
        return;
    }

    std::cerr << "[StateMachine] Vision failed: " << toString(e.result.error) << std::endl;
    out.push_back(effects::SpeakNotice{noticeFor(e.result.error)});
    transition(DeviceState::Listening, out);
}

void SessionStateMachine::on(const events::ManualVisionRequested& e, Effects& out) {
    if (!matcher_.visionEnabled()) {
        out.push_back(effects::SpeakNotice{NOTICE_VISION_DISABLED});
        return;
    }

    switch (state_) {
        case DeviceState::Listening:
            beginEpisode(e.prompt.empty() ? options_.default_prompt : e.prompt, out);
            return;

        case DeviceState::Idle:
            out.push_back(effects::SpeakNotice{NOTICE_NOT_CONNECTED});
            return;

        default:
            ignore("ManualVisionRequested");
            return;
    }
}

void SessionStateMachine::on(const events::CameraOpenFailed& e, Effects& out) {
    std::cerr << "[StateMachine] Camera open failed: " << e.reason << std::endl;
    out.push_back(effects::SpeakNotice{noticeFor(ErrorKind::DeviceUnavailable)});
}

// ============================================================================
// Remote voice
// ============================================================================

void SessionStateMachine::on(const events::RemoteSpeechStarted&, Effects& out) {
    switch (state_) {
        case DeviceState::Listening:
            remote_voice_ = true;
            transition(DeviceState::Speaking, out);
            return;
        case DeviceState::Speaking:
            remote_voice_ = true;
            return;
        default:
            ignore("RemoteSpeechStarted");
            return;
    }
}

void SessionStateMachine::on(const events::RemoteSpeechStopped&, Effects& out) {
    if (!remote_voice_) {
        ignore("RemoteSpeechStopped");
        return;
    }
    remote_voice_ = false;
    if (state_ == DeviceState::Speaking && playback_ == 0) {
        transition(DeviceState::Listening, out);
    }
}

void SessionStateMachine::on(const events::RemoteAudio& e, Effects& out) {
    // Late frames after an interrupt are dropped here
    if (state_ != DeviceState::Speaking || !remote_voice_) return;

    if (playback_ != 0) {
        held_remote_.push_back(e.pcm);
        return;
    }
    out.push_back(effects::PlayRemoteAudio{e.pcm});
}

void SessionStateMachine::on(const events::RemoteTranscript& e, Effects& out) {
    if (e.utterance.isVisionAnswer()) {
        std::cout << "[StateMachine] Echo of vision answer, not classified" << std::endl;
        return;
    }
    if (state_ == DeviceState::Idle) return;
    out.push_back(effects::ShowText{effects::TextRole::User, e.utterance.text()});
}

void SessionStateMachine::on(const events::RemoteSentence& e, Effects& out) {
    if (state_ == DeviceState::Idle) return;
    out.push_back(effects::ShowText{effects::TextRole::Assistant, e.text});
}

void SessionStateMachine::on(const events::RemoteEmotion& e, Effects& out) {
    if (state_ == DeviceState::Idle) return;
    out.push_back(effects::ShowText{effects::TextRole::Emotion, e.emotion});
}

} // namespace vtc
