#pragma once

/**
 * ProtocolClient.hpp - Connection to the remote voice service
 */

#include "vtc/core/Types.hpp"
#include "vtc/protocol/Messages.hpp"

#include <functional>
#include <string>
#include <vector>

namespace vtc::protocol {

/// Invoked on the transport's own thread. Implementations only post events.
struct ProtocolCallbacks {
    std::function<void(const std::string& session_id)> onConnected;
    std::function<void(const std::string& reason)> onConnectFailed;
    std::function<void(ErrorKind reason)> onDisconnected;
    std::function<void(const InboundMessage& message)> onMessage;
    std::function<void(std::vector<uint8_t> pcm)> onAudio;
};

class ProtocolClient {
public:
    virtual ~ProtocolClient() = default;

    virtual void setCallbacks(ProtocolCallbacks callbacks) = 0;

    /// Asynchronous: the outcome arrives as onConnected or onConnectFailed.
    virtual void connect() = 0;

    /// No onDisconnected callback for a disconnect the caller asked for.
    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    // Queued and written in call order. False when not connected.
    virtual bool sendText(const std::string& text) = 0;
    virtual bool sendAudioChunk(const std::vector<uint8_t>& pcm) = 0;
    virtual bool sendControl(ControlSignal signal) = 0;
};

} // namespace vtc::protocol
