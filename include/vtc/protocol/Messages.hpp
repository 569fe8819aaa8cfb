#pragma once

/**
 * Messages.hpp - JSON messages exchanged with the voice server
 */

#include "vtc/core/Event.hpp"
#include "vtc/core/Types.hpp"

#include <optional>
#include <string>

namespace vtc::protocol {

inline constexpr int PROTOCOL_VERSION = 1;

struct AudioParams {
    int sample_rate = 16000;
    int frame_duration_ms = 60;
};

std::string buildHello(const AudioParams& params);

/// Text utterance as a wake-word style "listen/detect" message.
std::string buildListenText(const std::string& session_id, const std::string& text);

std::string buildControl(const std::string& session_id, ControlSignal signal);

enum class InboundKind {
    Hello,
    TtsStart,
    TtsStop,
    TtsSentence,
    Stt,
    LlmEmotion,
    Unknown,
    Malformed
};

const char* toString(InboundKind kind);

struct InboundMessage {
    InboundKind kind = InboundKind::Unknown;
    std::string session_id;
    std::string text;   // sentence, transcript or emotion
    int sample_rate = 0;  // hello only, 0 if absent
};

InboundMessage parseInbound(const std::string& json_text);

/**
 * Session event for an inbound message.
 * nullopt for messages the transport consumes itself (hello) or that carry
 * nothing for the session.
 */
std::optional<Event> toEvent(const InboundMessage& message);

/// ws:// or wss:// endpoint split into its parts.
struct WsUrl {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";
};

std::optional<WsUrl> parseWsUrl(const std::string& url);

} // namespace vtc::protocol
