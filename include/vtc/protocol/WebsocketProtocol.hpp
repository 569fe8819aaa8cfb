#pragma once

/**
 * WebsocketProtocol.hpp - ProtocolClient over Boost.Beast WebSocket
 */

#include "vtc/protocol/ProtocolClient.hpp"

#include <memory>
#include <string>

namespace vtc::protocol {

struct WebsocketOptions {
    std::string url;
    std::string access_token;
    std::string device_id;
    std::string client_id;
    AudioParams audio;
    int hello_timeout_ms = 10000;
};

/**
 * One io thread owns the socket.
 * Public methods only post work to it, so they never block on the network.
 */
class WebsocketProtocol : public ProtocolClient {
public:
    explicit WebsocketProtocol(WebsocketOptions options);
    ~WebsocketProtocol() override;

    void setCallbacks(ProtocolCallbacks callbacks) override;
    void connect() override;
    void disconnect() override;
    bool isConnected() const override;

    bool sendText(const std::string& text) override;
    bool sendAudioChunk(const std::vector<uint8_t>& pcm) override;
    bool sendControl(ControlSignal signal) override;

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vtc::protocol
