/**
 * test_state_machine.cpp - Transition table scenarios
 */

#include "vtc/core/SessionStateMachine.hpp"
#include <cassert>
#include <iostream>
#include <vector>

using namespace vtc;

namespace {

const char* PROMPT = "图中描绘的是什么景象";

SessionStateMachine makeMachine(bool vision_enabled = true) {
    KeywordLists lists;
    lists.vision_enabled = vision_enabled;
    lists.vision = {"看看", "这是什么", "摄像头"};
    lists.camera = {
        {CameraAction::Open, {"打开摄像头"}},
        {CameraAction::Close, {"关闭摄像头"}},
    };

    MachineOptions options;
    options.default_prompt = PROMPT;
    options.reconnect_max_attempts = 2;
    options.reconnect_delay_ms = 100;
    return SessionStateMachine(KeywordMatcher(lists), options);
}

template <typename T>
const T* find(const Effects& fx) {
    for (const auto& e : fx) {
        if (auto p = std::get_if<T>(&e)) return p;
    }
    return nullptr;
}

template <typename T>
size_t count(const Effects& fx) {
    size_t n = 0;
    for (const auto& e : fx) {
        if (std::holds_alternative<T>(e)) ++n;
    }
    return n;
}

events::SpeechRecognized said(const std::string& text) {
    static uint64_t ordinal = 0;
    return {Utterance(text, UtteranceOrigin::UserSpeech, ++ordinal)};
}

void connect(SessionStateMachine& m) {
    m.handle(events::StartRequested{});
    m.handle(events::Connected{"s-1"});
    assert(m.state() == DeviceState::Listening);
}

// Drive the machine into VisionBusy, returns the episode id
uint64_t startEpisode(SessionStateMachine& m) {
    Effects fx = m.handle(said("帮我看看这是什么"));
    assert(m.state() == DeviceState::VisionBusy);
    auto run = find<effects::RunVisionPipeline>(fx);
    assert(run != nullptr);
    return run->episode;
}

} // anonymous namespace

void test_connect() {
    SessionStateMachine m = makeMachine();
    assert(m.state() == DeviceState::Idle);

    Effects fx = m.handle(events::StartRequested{});
    assert(m.state() == DeviceState::Connecting);
    assert(count<effects::OpenConnection>(fx) == 1);

    fx = m.handle(events::Connected{"abc"});
    assert(m.state() == DeviceState::Listening);
    auto capture = find<effects::SetCapture>(fx);
    assert(capture && capture->enabled);
    auto control = find<effects::SendControl>(fx);
    assert(control && control->signal == ControlSignal::StartListening);

    // Already connecting / connected
    assert(m.handle(events::StartRequested{}).empty());

    std::cout << "[PASS] test_connect" << std::endl;
}

void test_camera_open_stays_listening() {
    SessionStateMachine m = makeMachine();
    connect(m);

    Effects fx = m.handle(said("打开摄像头"));
    assert(fx.size() == 1);
    assert(count<effects::OpenCamera>(fx) == 1);
    assert(m.state() == DeviceState::Listening);

    fx = m.handle(said("关闭摄像头"));
    assert(count<effects::CloseCamera>(fx) == 1);
    assert(m.state() == DeviceState::Listening);

    std::cout << "[PASS] test_camera_open_stays_listening" << std::endl;
}

void test_vision_success() {
    SessionStateMachine m = makeMachine();
    connect(m);

    std::vector<std::pair<DeviceState, DeviceState>> transitions;
    m.setStateListener([&](DeviceState from, DeviceState to) { transitions.push_back({from, to}); });

    Effects fx = m.handle(said("帮我看看这是什么"));
    assert(m.state() == DeviceState::VisionBusy);
    assert(m.activeEpisode() != 0);

    // Stop listening, gate the microphone, then run the pipeline
    auto control = find<effects::SendControl>(fx);
    assert(control && control->signal == ControlSignal::StopListening);
    auto capture = find<effects::SetCapture>(fx);
    assert(capture && !capture->enabled);
    auto run = find<effects::RunVisionPipeline>(fx);
    assert(run && run->prompt == PROMPT && run->episode == m.activeEpisode());
    assert(count<effects::SendText>(fx) == 0);

    fx = m.handle(events::VisionPipelineDone{run->episode, VisionResult::ok("一张木桌")});
    assert(m.state() == DeviceState::Speaking);
    auto sent = find<effects::SendText>(fx);
    assert(sent && sent->text == "Vision Analysis: 一张木桌");
    auto play = find<effects::StartPlayback>(fx);
    assert(play && play->text == "一张木桌" && play->upload);
    assert(play->playback == m.activePlayback());

    fx = m.handle(events::SpeechPlaybackDone{play->playback, ErrorKind::None});
    assert(m.state() == DeviceState::Listening);
    assert(m.activePlayback() == 0);

    assert(transitions.size() == 3);
    assert(transitions[0].first == DeviceState::Listening && transitions[0].second == DeviceState::VisionBusy);
    assert(transitions[1].second == DeviceState::Speaking);
    assert(transitions[2].second == DeviceState::Listening);

    std::cout << "[PASS] test_vision_success" << std::endl;
}

void test_vision_timeout() {
    SessionStateMachine m = makeMachine();
    connect(m);
    uint64_t episode = startEpisode(m);

    Effects fx = m.handle(events::VisionPipelineDone{episode, VisionResult::failure(ErrorKind::AnalysisTimeout)});
    assert(m.state() == DeviceState::Listening);
    assert(count<effects::SendText>(fx) == 0);
    assert(count<effects::StartPlayback>(fx) == 0);
    auto notice = find<effects::SpeakNotice>(fx);
    assert(notice && notice->text == SessionStateMachine::noticeFor(ErrorKind::AnalysisTimeout));

    std::cout << "[PASS] test_vision_timeout" << std::endl;
}

void test_capture_failure_returns_to_listening() {
    SessionStateMachine m = makeMachine();
    connect(m);
    uint64_t episode = startEpisode(m);

    Effects fx = m.handle(events::VisionPipelineDone{episode, VisionResult::failure(ErrorKind::DeviceUnavailable)});
    assert(m.state() == DeviceState::Listening);
    auto notice = find<effects::SpeakNotice>(fx);
    assert(notice && notice->text == SessionStateMachine::noticeFor(ErrorKind::DeviceUnavailable));

    std::cout << "[PASS] test_capture_failure_returns_to_listening" << std::endl;
}

void test_disconnect_during_vision() {
    SessionStateMachine m = makeMachine();
    connect(m);
    uint64_t episode = startEpisode(m);

    Effects fx = m.handle(events::Disconnected{ErrorKind::ConnectionLost});
    assert(m.state() == DeviceState::Idle);
    auto cancel = find<effects::CancelVision>(fx);
    assert(cancel && cancel->episode == episode);
    assert(count<effects::CloseCamera>(fx) == 1);
    assert(count<effects::ScheduleReconnect>(fx) == 1);

    // Late completion has no effect at all
    fx = m.handle(events::VisionPipelineDone{episode, VisionResult::ok("一张木桌")});
    assert(fx.empty());
    assert(m.state() == DeviceState::Idle);

    std::cout << "[PASS] test_disconnect_during_vision" << std::endl;
}

void test_single_episode() {
    SessionStateMachine m = makeMachine();
    connect(m);
    uint64_t episode = startEpisode(m);

    assert(m.handle(said("再看看这是什么")).empty());
    assert(m.handle(events::ManualVisionRequested{"桌上有什么"}).empty());
    assert(m.activeEpisode() == episode);

    std::cout << "[PASS] test_single_episode" << std::endl;
}

void test_interrupt_while_speaking() {
    SessionStateMachine m = makeMachine();
    connect(m);
    uint64_t episode = startEpisode(m);
    Effects fx = m.handle(events::VisionPipelineDone{episode, VisionResult::ok("一只猫")});
    uint64_t playback = find<effects::StartPlayback>(fx)->playback;

    fx = m.handle(events::UserInterrupt{});
    assert(m.state() == DeviceState::Listening);
    assert(count<effects::StopPlayback>(fx) == 1);
    // No remote voice: nothing to abort upstream
    assert(count<effects::SendControl>(fx) == 1);
    assert(find<effects::SendControl>(fx)->signal == ControlSignal::StartListening);

    // The player's completion for the aborted playback is stale
    fx = m.handle(events::SpeechPlaybackDone{playback, ErrorKind::None});
    assert(fx.empty());
    assert(m.state() == DeviceState::Listening);

    std::cout << "[PASS] test_interrupt_while_speaking" << std::endl;
}

void test_interrupt_during_vision() {
    SessionStateMachine m = makeMachine();
    connect(m);
    uint64_t episode = startEpisode(m);

    Effects fx = m.handle(events::UserInterrupt{});
    assert(m.state() == DeviceState::Listening);
    auto cancel = find<effects::CancelVision>(fx);
    assert(cancel && cancel->episode == episode);

    fx = m.handle(events::VisionPipelineDone{episode, VisionResult::ok("迟到的结果")});
    assert(fx.empty());

    // A fresh trigger starts a new episode
    uint64_t next = startEpisode(m);
    assert(next != episode);

    std::cout << "[PASS] test_interrupt_during_vision" << std::endl;
}

void test_vision_answer_forwarded() {
    SessionStateMachine m = makeMachine();
    connect(m);

    Utterance answer("桌上有一台打开摄像头的电脑", UtteranceOrigin::VisionAnswer, 9);
    Effects fx = m.handle(events::SpeechRecognized{answer});
    assert(m.state() == DeviceState::Listening);
    assert(count<effects::OpenCamera>(fx) == 0);
    assert(count<effects::RunVisionPipeline>(fx) == 0);
    auto sent = find<effects::SendText>(fx);
    assert(sent && sent->text == "Vision Analysis: 桌上有一台打开摄像头的电脑");

    std::cout << "[PASS] test_vision_answer_forwarded" << std::endl;
}

void test_ordinary_speech_sent() {
    SessionStateMachine m = makeMachine();
    connect(m);

    Effects fx = m.handle(said("今天天气怎么样"));
    auto sent = find<effects::SendText>(fx);
    assert(sent && sent->text == "今天天气怎么样");
    assert(m.state() == DeviceState::Listening);

    std::cout << "[PASS] test_ordinary_speech_sent" << std::endl;
}

void test_trigger_while_idle() {
    SessionStateMachine m = makeMachine();

    Effects fx = m.handle(said("帮我看看"));
    assert(m.state() == DeviceState::Idle);
    assert(count<effects::RunVisionPipeline>(fx) == 0);
    assert(count<effects::SpeakNotice>(fx) == 1);

    // Camera control works without a connection
    fx = m.handle(said("打开摄像头"));
    assert(count<effects::OpenCamera>(fx) == 1);

    std::cout << "[PASS] test_trigger_while_idle" << std::endl;
}

void test_reconnect_bound() {
    SessionStateMachine m = makeMachine();  // 2 attempts

    m.handle(events::StartRequested{});
    Effects fx = m.handle(events::ConnectFailed{"refused"});
    assert(m.state() == DeviceState::Idle);
    auto r = find<effects::ScheduleReconnect>(fx);
    assert(r && r->attempt == 1 && r->delay_ms == 100);

    m.handle(events::StartRequested{});
    fx = m.handle(events::ConnectFailed{"refused"});
    assert(find<effects::ScheduleReconnect>(fx)->attempt == 2);

    m.handle(events::StartRequested{});
    fx = m.handle(events::ConnectFailed{"refused"});
    assert(count<effects::ScheduleReconnect>(fx) == 0);
    assert(count<effects::SpeakNotice>(fx) == 1);

    // A successful connection resets the counter
    m.handle(events::StartRequested{});
    m.handle(events::Connected{"s-2"});
    assert(m.reconnectAttempts() == 0);

    std::cout << "[PASS] test_reconnect_bound" << std::endl;
}

void test_user_disconnect_no_reconnect() {
    SessionStateMachine m = makeMachine();
    connect(m);

    Effects fx = m.handle(events::Disconnected{ErrorKind::None});
    assert(m.state() == DeviceState::Idle);
    assert(count<effects::ScheduleReconnect>(fx) == 0);
    assert(count<effects::SpeakNotice>(fx) == 0);

    std::cout << "[PASS] test_user_disconnect_no_reconnect" << std::endl;
}

void test_remote_speech() {
    SessionStateMachine m = makeMachine();
    connect(m);

    // Outside Speaking remote audio is dropped
    assert(m.handle(events::RemoteAudio{{1, 2}}).empty());

    Effects fx = m.handle(events::RemoteSpeechStarted{});
    assert(m.state() == DeviceState::Speaking);
    assert(m.remoteVoiceActive());
    assert(find<effects::SetCapture>(fx) && !find<effects::SetCapture>(fx)->enabled);

    fx = m.handle(events::RemoteAudio{{1, 2, 3, 4}});
    assert(count<effects::PlayRemoteAudio>(fx) == 1);

    fx = m.handle(events::RemoteSpeechStopped{});
    assert(m.state() == DeviceState::Listening);

    // Interrupt aborts the remote turn
    m.handle(events::RemoteSpeechStarted{});
    fx = m.handle(events::UserInterrupt{});
    assert(m.state() == DeviceState::Listening);
    auto abort = find<effects::SendControl>(fx);
    assert(abort && abort->signal == ControlSignal::Abort);
    assert(m.handle(events::RemoteAudio{{5, 6}}).empty());

    std::cout << "[PASS] test_remote_speech" << std::endl;
}

void test_remote_text() {
    SessionStateMachine m = makeMachine();

    // Nothing is shown before the connection exists
    assert(m.handle(events::RemoteSentence{"你好"}).empty());
    connect(m);

    Effects fx = m.handle(events::RemoteSentence{"你好"});
    auto shown = find<effects::ShowText>(fx);
    assert(shown && shown->role == effects::TextRole::Assistant);

    fx = m.handle(events::RemoteTranscript{Utterance::fromInbound("Vision Analysis: 一张木桌", 0)});
    assert(fx.empty());

    fx = m.handle(events::RemoteTranscript{Utterance::fromInbound("打开摄像头", 0)});
    assert(count<effects::OpenCamera>(fx) == 0);
    assert(find<effects::ShowText>(fx)->role == effects::TextRole::User);

    fx = m.handle(events::RemoteEmotion{"happy"});
    assert(find<effects::ShowText>(fx)->role == effects::TextRole::Emotion);

    std::cout << "[PASS] test_remote_text" << std::endl;
}

void test_manual_vision() {
    SessionStateMachine m = makeMachine();
    connect(m);

    Effects fx = m.handle(events::ManualVisionRequested{"桌上有什么"});
    auto run = find<effects::RunVisionPipeline>(fx);
    assert(run && run->prompt == "桌上有什么");
    assert(m.state() == DeviceState::VisionBusy);

    SessionStateMachine d = makeMachine(false);
    connect(d);
    fx = d.handle(events::ManualVisionRequested{});
    assert(count<effects::RunVisionPipeline>(fx) == 0);
    assert(count<effects::SpeakNotice>(fx) == 1);
    assert(d.state() == DeviceState::Listening);

    std::cout << "[PASS] test_manual_vision" << std::endl;
}

void test_remote_audio_waits_for_vision_answer() {
    SessionStateMachine m = makeMachine();
    connect(m);
    uint64_t episode = startEpisode(m);
    Effects fx = m.handle(events::VisionPipelineDone{episode, VisionResult::ok("一张木桌")});
    uint64_t playback = find<effects::StartPlayback>(fx)->playback;
    assert(m.state() == DeviceState::Speaking);

    // The server starts talking while the answer is still playing
    m.handle(events::RemoteSpeechStarted{});
    assert(m.remoteVoiceActive());
    assert(m.handle(events::RemoteAudio{{1, 2}}).empty());
    assert(m.handle(events::RemoteAudio{{3, 4}}).empty());

    fx = m.handle(events::SpeechPlaybackDone{playback, ErrorKind::None});
    assert(count<effects::PlayRemoteAudio>(fx) == 2);
    assert(std::get<effects::PlayRemoteAudio>(fx[0]).pcm == std::vector<uint8_t>({1, 2}));
    assert(std::get<effects::PlayRemoteAudio>(fx[1]).pcm == std::vector<uint8_t>({3, 4}));
    assert(m.state() == DeviceState::Speaking);

    // Once the answer is done remote frames go straight to the sink
    fx = m.handle(events::RemoteAudio{{5, 6}});
    assert(count<effects::PlayRemoteAudio>(fx) == 1);

    m.handle(events::RemoteSpeechStopped{});
    assert(m.state() == DeviceState::Listening);

    std::cout << "[PASS] test_remote_audio_waits_for_vision_answer" << std::endl;
}

void test_interrupt_drops_held_remote_audio() {
    SessionStateMachine m = makeMachine();
    connect(m);
    uint64_t episode = startEpisode(m);
    Effects fx = m.handle(events::VisionPipelineDone{episode, VisionResult::ok("一只猫")});
    uint64_t playback = find<effects::StartPlayback>(fx)->playback;

    m.handle(events::RemoteSpeechStarted{});
    m.handle(events::RemoteAudio{{7, 7}});

    fx = m.handle(events::UserInterrupt{});
    assert(count<effects::PlayRemoteAudio>(fx) == 0);
    assert(m.state() == DeviceState::Listening);

    // The player's completion arrives late and releases nothing
    fx = m.handle(events::SpeechPlaybackDone{playback, ErrorKind::Cancelled});
    assert(count<effects::PlayRemoteAudio>(fx) == 0);

    std::cout << "[PASS] test_interrupt_drops_held_remote_audio" << std::endl;
}

void test_synthesis_failure_ends_speaking() {
    SessionStateMachine m = makeMachine();
    connect(m);
    uint64_t episode = startEpisode(m);
    Effects fx = m.handle(events::VisionPipelineDone{episode, VisionResult::ok("一只猫")});
    uint64_t playback = find<effects::StartPlayback>(fx)->playback;

    m.handle(events::SpeechPlaybackDone{playback, ErrorKind::SynthesisFailed});
    assert(m.state() == DeviceState::Listening);

    std::cout << "[PASS] test_synthesis_failure_ends_speaking" << std::endl;
}

void test_deterministic() {
    std::vector<Event> script = {
        events::StartRequested{},
        events::Connected{"x"},
        said("帮我看看"),
        events::VisionPipelineDone{1, VisionResult::ok("一张木桌")},
        events::UserInterrupt{},
        events::RemoteSpeechStarted{},
        events::Disconnected{ErrorKind::ConnectionLost},
    };

    SessionStateMachine a = makeMachine();
    SessionStateMachine b = makeMachine();
    for (const auto& event : script) {
        Effects fa = a.handle(event);
        Effects fb = b.handle(event);
        assert(a.state() == b.state());
        assert(fa.size() == fb.size());
        for (size_t i = 0; i < fa.size(); ++i) {
            assert(fa[i].index() == fb[i].index());
        }
    }
    assert(a.state() == DeviceState::Idle);

    std::cout << "[PASS] test_deterministic" << std::endl;
}

void test_nested_handle_rejected() {
    SessionStateMachine m = makeMachine();
    bool nested_empty = false;
    m.setStateListener([&](DeviceState, DeviceState) {
        nested_empty = m.handle(events::Connected{"y"}).empty();
    });

    m.handle(events::StartRequested{});
    assert(nested_empty);
    assert(m.state() == DeviceState::Connecting);

    std::cout << "[PASS] test_nested_handle_rejected" << std::endl;
}

int main() {
    std::cout << "=== SessionStateMachine Tests ===" << std::endl;

    test_connect();
    test_camera_open_stays_listening();
    test_vision_success();
    test_vision_timeout();
    test_capture_failure_returns_to_listening();
    test_disconnect_during_vision();
    test_single_episode();
    test_interrupt_while_speaking();
    test_interrupt_during_vision();
    test_vision_answer_forwarded();
    test_ordinary_speech_sent();
    test_trigger_while_idle();
    test_reconnect_bound();
    test_user_disconnect_no_reconnect();
    test_remote_speech();
    test_remote_text();
    test_remote_audio_waits_for_vision_answer();
    test_interrupt_drops_held_remote_audio();
    test_manual_vision();
    test_synthesis_failure_ends_speaking();
    test_deterministic();
    test_nested_handle_rejected();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
