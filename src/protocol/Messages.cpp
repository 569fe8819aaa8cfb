/**
 * Messages.cpp - Protocol JSON build/parse
 */

#include "vtc/protocol/Messages.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vtc::protocol {

std::string buildHello(const AudioParams& params) {
    json hello = {
        {"type", "hello"},
        {"version", PROTOCOL_VERSION},
        {"transport", "websocket"},
        {"audio_params", {
            {"format", "pcm"},
            {"sample_rate", params.sample_rate},
            {"channels", 1},
            {"frame_duration", params.frame_duration_ms}
        }}
    };
    return hello.dump();
}

std::string buildListenText(const std::string& session_id, const std::string& text) {
    json msg = {
        {"session_id", session_id},
        {"type", "listen"},
        {"state", "detect"},
        {"text", text}
    };
    return msg.dump(-1, ' ', false);
}

std::string buildControl(const std::string& session_id, ControlSignal signal) {
    json msg = {{"session_id", session_id}};

    switch (signal) {
        case ControlSignal::StartListening:
            msg["type"] = "listen";
            msg["state"] = "start";
            msg["mode"] = "auto";
            break;
        case ControlSignal::StopListening:
            msg["type"] = "listen";
            msg["state"] = "stop";
            break;
        case ControlSignal::Abort:
            msg["type"] = "abort";
            msg["reason"] = "none";
            break;
    }
    return msg.dump();
}

const char* toString(InboundKind kind) {
    switch (kind) {
        case InboundKind::Hello:       return "hello";
        case InboundKind::TtsStart:    return "tts/start";
        case InboundKind::TtsStop:     return "tts/stop";
        case InboundKind::TtsSentence: return "tts/sentence_start";
        case InboundKind::Stt:         return "stt";
        case InboundKind::LlmEmotion:  return "llm";
        case InboundKind::Unknown:     return "unknown";
        case InboundKind::Malformed:   return "malformed";
    }
    return "unknown";
}

InboundMessage parseInbound(const std::string& json_text) {
    InboundMessage msg;

    try {
        json root = json::parse(json_text);

        if (!root.is_object() || !root.contains("type") || !root["type"].is_string()) {
            msg.kind = InboundKind::Malformed;
            return msg;
        }

        std::string type = root["type"];
        msg.session_id = root.value("session_id", "");

        if (type == "hello") {
            msg.kind = InboundKind::Hello;
            if (root.contains("audio_params") && root["audio_params"].is_object()) {
                msg.sample_rate = root["audio_params"].value("sample_rate", 0);
            }
        } else if (type == "tts") {
            std::string state = root.value("state", "");
            if (state == "start") {
                msg.kind = InboundKind::TtsStart;
            } else if (state == "stop") {
                msg.kind = InboundKind::TtsStop;
            } else if (state == "sentence_start") {
                msg.kind = InboundKind::TtsSentence;
                msg.text = root.value("text", "");
            }
        } else if (type == "stt") {
            msg.kind = InboundKind::Stt;
            msg.text = root.value("text", "");
        } else if (type == "llm") {
            msg.kind = InboundKind::LlmEmotion;
            msg.text = root.value("emotion", "");
        }
    } catch (const std::exception& e) {
        // Parse error or a field of the wrong type
        std::cerr << "[Protocol] Bad message: " << e.what() << std::endl;
        msg = InboundMessage{};
        msg.kind = InboundKind::Malformed;
    }

    return msg;
}

std::optional<Event> toEvent(const InboundMessage& message) {
    switch (message.kind) {
        case InboundKind::TtsStart:
            return events::RemoteSpeechStarted{};
        case InboundKind::TtsStop:
            return events::RemoteSpeechStopped{};
        case InboundKind::TtsSentence:
            if (message.text.empty()) return std::nullopt;
            return events::RemoteSentence{message.text};
        case InboundKind::Stt:
            if (message.text.empty()) return std::nullopt;
            return events::RemoteTranscript{Utterance::fromInbound(message.text, 0)};
        case InboundKind::LlmEmotion:
            if (message.text.empty()) return std::nullopt;
            return events::RemoteEmotion{message.text};
        default:
            return std::nullopt;
    }
}

std::optional<WsUrl> parseWsUrl(const std::string& url) {
    WsUrl out;
    std::string rest;

    if (url.rfind("wss://", 0) == 0) {
        out.secure = true;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        rest = url.substr(5);
    } else {
        return std::nullopt;
    }

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        out.target = rest.substr(slash);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
        if (out.port.empty() ||
            out.port.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
    } else {
        out.host = authority;
        out.port = out.secure ? "443" : "80";
    }

    if (out.host.empty()) return std::nullopt;
    return out;
}

} // namespace vtc::protocol
