/**
 * test_messages.cpp - Protocol message building and parsing
 */

#include "vtc/protocol/Messages.hpp"
#include <cassert>
#include <iostream>

#include <nlohmann/json.hpp>

using namespace vtc;
using namespace vtc::protocol;
using json = nlohmann::json;

void test_hello() {
    AudioParams params;
    params.sample_rate = 24000;
    params.frame_duration_ms = 20;

    json hello = json::parse(buildHello(params));
    assert(hello["type"] == "hello");
    assert(hello["version"] == 1);
    assert(hello["transport"] == "websocket");
    assert(hello["audio_params"]["format"] == "pcm");
    assert(hello["audio_params"]["sample_rate"] == 24000);
    assert(hello["audio_params"]["channels"] == 1);
    assert(hello["audio_params"]["frame_duration"] == 20);

    std::cout << "[PASS] test_hello" << std::endl;
}

void test_outbound_text() {
    Utterance answer("一张木桌", UtteranceOrigin::VisionAnswer, 1);
    json msg = json::parse(buildListenText("s-1", answer.outboundText()));
    assert(msg["session_id"] == "s-1");
    assert(msg["type"] == "listen");
    assert(msg["state"] == "detect");
    assert(msg["text"] == "Vision Analysis: 一张木桌");

    std::cout << "[PASS] test_outbound_text" << std::endl;
}

void test_controls() {
    json start = json::parse(buildControl("s", ControlSignal::StartListening));
    assert(start["type"] == "listen" && start["state"] == "start" && start["mode"] == "auto");

    json stop = json::parse(buildControl("s", ControlSignal::StopListening));
    assert(stop["type"] == "listen" && stop["state"] == "stop");
    assert(!stop.contains("mode"));

    json abort = json::parse(buildControl("s", ControlSignal::Abort));
    assert(abort["type"] == "abort" && abort["reason"] == "none");

    std::cout << "[PASS] test_controls" << std::endl;
}

void test_parse_inbound() {
    InboundMessage hello = parseInbound(
        R"({"type":"hello","session_id":"abc","audio_params":{"sample_rate":16000}})");
    assert(hello.kind == InboundKind::Hello);
    assert(hello.session_id == "abc");
    assert(hello.sample_rate == 16000);
    assert(!toEvent(hello));

    assert(parseInbound(R"({"type":"tts","state":"start"})").kind == InboundKind::TtsStart);
    assert(parseInbound(R"({"type":"tts","state":"stop"})").kind == InboundKind::TtsStop);

    InboundMessage sentence = parseInbound(R"({"type":"tts","state":"sentence_start","text":"你好"})");
    assert(sentence.kind == InboundKind::TtsSentence && sentence.text == "你好");

    InboundMessage emotion = parseInbound(R"({"type":"llm","emotion":"happy"})");
    assert(emotion.kind == InboundKind::LlmEmotion && emotion.text == "happy");

    assert(parseInbound(R"({"type":"iot"})").kind == InboundKind::Unknown);

    std::cout << "[PASS] test_parse_inbound" << std::endl;
}

void test_malformed() {
    assert(parseInbound("{").kind == InboundKind::Malformed);
    assert(parseInbound("[1,2]").kind == InboundKind::Malformed);
    assert(parseInbound(R"({"type":5})").kind == InboundKind::Malformed);
    assert(parseInbound(R"({"text":"x"})").kind == InboundKind::Malformed);
    // Right type, wrong field type
    assert(parseInbound(R"({"type":"stt","text":42})").kind == InboundKind::Malformed);

    std::cout << "[PASS] test_malformed" << std::endl;
}

void test_to_event() {
    auto started = toEvent(parseInbound(R"({"type":"tts","state":"start"})"));
    assert(started && std::holds_alternative<events::RemoteSpeechStarted>(*started));

    auto transcript = toEvent(parseInbound(R"({"type":"stt","text":"Vision Analysis: 一只猫"})"));
    assert(transcript);
    const auto& t = std::get<events::RemoteTranscript>(*transcript);
    assert(t.utterance.isVisionAnswer());
    assert(t.utterance.text() == "一只猫");

    auto plain = toEvent(parseInbound(R"({"type":"stt","text":"打开摄像头"})"));
    assert(!std::get<events::RemoteTranscript>(*plain).utterance.isVisionAnswer());

    // Empty texts carry nothing
    assert(!toEvent(parseInbound(R"({"type":"stt","text":""})")));
    assert(!toEvent(parseInbound("{")));

    std::cout << "[PASS] test_to_event" << std::endl;
}

void test_ws_url() {
    auto plain = parseWsUrl("ws://127.0.0.1:8000/xiaozhi/v1/");
    assert(plain && !plain->secure);
    assert(plain->host == "127.0.0.1" && plain->port == "8000");
    assert(plain->target == "/xiaozhi/v1/");

    auto secure = parseWsUrl("wss://api.example.com");
    assert(secure && secure->secure);
    assert(secure->port == "443" && secure->target == "/");

    assert(!parseWsUrl("http://example.com"));
    assert(!parseWsUrl("ws://:80/"));
    assert(!parseWsUrl("ws://host:abc/"));

    std::cout << "[PASS] test_ws_url" << std::endl;
}

int main() {
    std::cout << "=== Protocol Message Tests ===" << std::endl;

    test_hello();
    test_outbound_text();
    test_controls();
    test_parse_inbound();
    test_malformed();
    test_to_event();
    test_ws_url();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
