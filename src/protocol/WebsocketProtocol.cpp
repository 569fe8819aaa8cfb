/**
 * WebsocketProtocol.cpp - Async Beast client with an ordered write queue
 *
 * resolve -> connect -> [TLS] -> WS handshake -> hello -> server hello
 */

#include "vtc/protocol/WebsocketProtocol.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>

#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace vtc::protocol {

namespace {

struct ConnectionListener {
    std::function<void()> onOpen;
    std::function<void(std::string)> onText;
    std::function<void(std::vector<uint8_t>)> onBinary;
    std::function<void(const std::string& reason)> onClosed;
};

using Headers = std::vector<std::pair<std::string, std::string>>;

class ConnectionBase {
public:
    virtual ~ConnectionBase() = default;
    virtual void start() = 0;
    virtual void send(std::string payload, bool binary) = 0;
    virtual void close() = 0;
};

// All members run on the io thread
template <bool Secure>
class Connection : public ConnectionBase,
                   public std::enable_shared_from_this<Connection<Secure>> {
    using Stream = std::conditional_t<Secure,
        websocket::stream<beast::ssl_stream<beast::tcp_stream>>,
        websocket::stream<beast::tcp_stream>>;

    struct Outgoing {
        std::string data;
        bool binary;
    };

public:
    Connection(net::io_context& io, ssl::context& ssl_ctx, WsUrl url,
               Headers headers, ConnectionListener listener)
        : resolver_(net::make_strand(io))
        , url_(std::move(url))
        , headers_(std::move(headers))
        , listener_(std::move(listener)) {
        if constexpr (Secure) {
            ws_.emplace(net::make_strand(io), ssl_ctx);
        } else {
            (void)ssl_ctx;
            ws_.emplace(net::make_strand(io));
        }
    }

    void start() override {
        resolver_.async_resolve(url_.host, url_.port,
            beast::bind_front_handler(&Connection::onResolve, this->shared_from_this()));
    }

    void send(std::string payload, bool binary) override {
        if (!open_ || closing_) return;
        queue_.push_back({std::move(payload), binary});
        if (queue_.size() > 1) return;  // write already in progress
        doWrite();
    }

    void close() override {
        if (closing_) return;
        closing_ = true;
        reported_ = true;

        if (!open_) {
            resolver_.cancel();
            beast::error_code ec;
            beast::get_lowest_layer(*ws_).socket().close(ec);
            return;
        }

        ws_->async_close(websocket::close_code::normal,
            [self = this->shared_from_this()](beast::error_code ec) {
                if (ec) {
                    std::cerr << "[WebSocket] Close: " << ec.message() << std::endl;
                }
            });
    }

private:
    void fail(const char* stage, beast::error_code ec) {
        if (reported_) return;
        reported_ = true;
        open_ = false;
        std::string reason = std::string(stage) + ": " + ec.message();
        if (listener_.onClosed) listener_.onClosed(reason);
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail("resolve", ec);

        beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(10));
        beast::get_lowest_layer(*ws_).async_connect(results,
            beast::bind_front_handler(&Connection::onConnect, this->shared_from_this()));
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
        if (ec) return fail("connect", ec);

        host_header_ = url_.host + ":" + std::to_string(endpoint.port());

        if constexpr (Secure) {
            if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), url_.host.c_str())) {
                ec = beast::error_code(static_cast<int>(::ERR_get_error()),
                                       net::error::get_ssl_category());
                return fail("sni", ec);
            }
            ws_->next_layer().set_verify_callback(ssl::host_name_verification(url_.host));
            ws_->next_layer().async_handshake(ssl::stream_base::client,
                beast::bind_front_handler(&Connection::onTlsHandshake, this->shared_from_this()));
        } else {
            doWsHandshake();
        }
    }

    void onTlsHandshake(beast::error_code ec) {
        if (ec) return fail("tls", ec);
        doWsHandshake();
    }

    void doWsHandshake() {
        // The websocket stream has its own timeouts
        beast::get_lowest_layer(*ws_).expires_never();
        ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_->set_option(websocket::stream_base::decorator(
            [headers = headers_](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "visiontalk-client");
                for (const auto& [name, value] : headers) {
                    req.set(name, value);
                }
            }));

        ws_->async_handshake(host_header_, url_.target,
            beast::bind_front_handler(&Connection::onHandshake, this->shared_from_this()));
    }

    void onHandshake(beast::error_code ec) {
        if (ec) return fail("handshake", ec);

        open_ = true;
        if (listener_.onOpen) listener_.onOpen();
        doRead();
    }

    void doRead() {
        ws_->async_read(buffer_,
            beast::bind_front_handler(&Connection::onRead, this->shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) return fail(ec == websocket::error::closed ? "closed by server" : "read", ec);

        if (ws_->got_binary()) {
            auto data = buffer_.data();
            const auto* begin = static_cast<const uint8_t*>(data.data());
            std::vector<uint8_t> bytes(begin, begin + data.size());
            buffer_.consume(buffer_.size());
            if (listener_.onBinary) listener_.onBinary(std::move(bytes));
        } else {
            std::string text = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());
            if (listener_.onText) listener_.onText(std::move(text));
        }

        if (!reported_) doRead();
    }

    void doWrite() {
        Outgoing& next = queue_.front();
        ws_->binary(next.binary);
        ws_->async_write(net::buffer(next.data),
            beast::bind_front_handler(&Connection::onWrite, this->shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            queue_.clear();
            return fail("write", ec);
        }
        queue_.pop_front();
        if (!queue_.empty() && !closing_) doWrite();
    }

    tcp::resolver resolver_;
    std::optional<Stream> ws_;
    beast::flat_buffer buffer_;
    WsUrl url_;
    Headers headers_;
    ConnectionListener listener_;
    std::string host_header_;
    std::deque<Outgoing> queue_;
    bool open_ = false;
    bool closing_ = false;
    bool reported_ = false;
};

} // anonymous namespace

struct WebsocketProtocol::Impl {
    WebsocketOptions options;
    ProtocolCallbacks callbacks;

    net::io_context io;
    net::executor_work_guard<net::io_context::executor_type> work{io.get_executor()};
    ssl::context ssl_ctx{ssl::context::tls_client};
    std::thread io_thread;

    // io thread only
    std::shared_ptr<ConnectionBase> conn;
    net::steady_timer hello_timer{io};
    uint64_t conn_id = 0;
    std::string session_id;

    std::atomic<bool> connected{false};

    mutable std::mutex error_mutex;
    std::string last_error;

    void setError(const std::string& error) {
        std::lock_guard<std::mutex> lock(error_mutex);
        last_error = error;
    }

    Headers headers() const {
        Headers h;
        h.emplace_back("Authorization", "Bearer " + options.access_token);
        h.emplace_back("Protocol-Version", std::to_string(PROTOCOL_VERSION));
        h.emplace_back("Device-Id", options.device_id);
        h.emplace_back("Client-Id", options.client_id);
        return h;
    }

    // Forget the current connection without reporting anything
    void drop() {
        ++conn_id;
        connected = false;
        session_id.clear();
        hello_timer.cancel();
        if (conn) {
            conn->close();
            conn.reset();
        }
    }

    void open() {
        drop();

        auto url = parseWsUrl(options.url);
        if (!url) {
            setError("invalid url " + options.url);
            std::cerr << "[WebSocket] Invalid URL: " << options.url << std::endl;
            if (callbacks.onConnectFailed) callbacks.onConnectFailed("invalid url");
            return;
        }

        uint64_t id = conn_id;
        ConnectionListener listener;
        listener.onOpen = [this, id]() { if (id == conn_id) onOpen(id); };
        listener.onText = [this, id](std::string text) { if (id == conn_id) onText(text); };
        listener.onBinary = [this, id](std::vector<uint8_t> data) {
            if (id == conn_id && connected && callbacks.onAudio) {
                callbacks.onAudio(std::move(data));
            }
        };
        listener.onClosed = [this, id](const std::string& reason) {
            if (id == conn_id) onClosed(reason);
        };

        std::cout << "[WebSocket] Connecting to " << url->host << ":" << url->port
                  << url->target << (url->secure ? " (tls)" : "") << std::endl;

        if (url->secure) {
            conn = std::make_shared<Connection<true>>(io, ssl_ctx, *url, headers(), std::move(listener));
        } else {
            conn = std::make_shared<Connection<false>>(io, ssl_ctx, *url, headers(), std::move(listener));
        }
        conn->start();
    }

    void onOpen(uint64_t id) {
        std::cout << "[WebSocket] Handshake done, sending hello" << std::endl;
        conn->send(buildHello(options.audio), false);

        hello_timer.expires_after(std::chrono::milliseconds(options.hello_timeout_ms));
        hello_timer.async_wait([this, id](beast::error_code ec) {
            if (ec || id != conn_id || connected) return;
            setError("server hello timeout");
            std::cerr << "[WebSocket] No server hello within "
                      << options.hello_timeout_ms << " ms" << std::endl;
            drop();
            if (callbacks.onConnectFailed) callbacks.onConnectFailed("server hello timeout");
        });
    }

    void onText(const std::string& text) {
        InboundMessage msg = parseInbound(text);

        if (msg.kind == InboundKind::Hello) {
            if (connected) return;
            hello_timer.cancel();
            session_id = msg.session_id;
            connected = true;
            std::cout << "[WebSocket] Connected, session " << session_id << std::endl;
            if (msg.sample_rate != 0 && msg.sample_rate != options.audio.sample_rate) {
                std::cerr << "[WebSocket] Server audio rate " << msg.sample_rate
                          << " differs from ours (" << options.audio.sample_rate << ")" << std::endl;
            }
            if (callbacks.onConnected) callbacks.onConnected(session_id);
            return;
        }

        if (!connected) return;
        if (msg.kind == InboundKind::Malformed || msg.kind == InboundKind::Unknown) {
            std::cout << "[WebSocket] Ignoring message: " << text.substr(0, 120) << std::endl;
            return;
        }
        if (callbacks.onMessage) callbacks.onMessage(msg);
    }

    void onClosed(const std::string& reason) {
        bool was_connected = connected.exchange(false);
        ++conn_id;
        hello_timer.cancel();
        conn.reset();
        setError(reason);

        std::cerr << "[WebSocket] Connection closed: " << reason << std::endl;

        if (was_connected) {
            if (callbacks.onDisconnected) callbacks.onDisconnected(ErrorKind::ConnectionLost);
        } else {
            if (callbacks.onConnectFailed) callbacks.onConnectFailed(reason);
        }
    }

    bool post(std::string payload, bool binary) {
        if (!connected) return false;
        net::post(io, [this, payload = std::move(payload), binary]() mutable {
            if (connected && conn) conn->send(std::move(payload), binary);
        });
        return true;
    }
};

WebsocketProtocol::WebsocketProtocol(WebsocketOptions options)
    : impl_(std::make_unique<Impl>()) {
    impl_->options = std::move(options);
    impl_->ssl_ctx.set_default_verify_paths();
    impl_->ssl_ctx.set_verify_mode(ssl::verify_peer);
    impl_->io_thread = std::thread([this]() {
        try {
            impl_->io.run();
        } catch (const std::exception& e) {
            std::cerr << "[WebSocket] io thread stopped: " << e.what() << std::endl;
        }
    });
}

WebsocketProtocol::~WebsocketProtocol() {
    net::post(impl_->io, [this]() { impl_->drop(); });
    impl_->work.reset();
    // Give the close frame a moment, then stop whatever is still pending
    net::post(impl_->io, [this]() { impl_->io.stop(); });
    if (impl_->io_thread.joinable()) {
        impl_->io_thread.join();
    }
}

void WebsocketProtocol::setCallbacks(ProtocolCallbacks callbacks) {
    impl_->callbacks = std::move(callbacks);
}

void WebsocketProtocol::connect() {
    net::post(impl_->io, [this]() { impl_->open(); });
}

void WebsocketProtocol::disconnect() {
    impl_->connected = false;
    net::post(impl_->io, [this]() {
        std::cout << "[WebSocket] Disconnecting" << std::endl;
        impl_->drop();
    });
}

bool WebsocketProtocol::isConnected() const { return impl_->connected; }

bool WebsocketProtocol::sendText(const std::string& text) {
    if (!impl_->connected) return false;
    net::post(impl_->io, [this, text]() {
        if (impl_->connected && impl_->conn) {
            impl_->conn->send(buildListenText(impl_->session_id, text), false);
        }
    });
    return true;
}

bool WebsocketProtocol::sendAudioChunk(const std::vector<uint8_t>& pcm) {
    return impl_->post(std::string(pcm.begin(), pcm.end()), true);
}

bool WebsocketProtocol::sendControl(ControlSignal signal) {
    if (!impl_->connected) return false;
    net::post(impl_->io, [this, signal]() {
        if (impl_->connected && impl_->conn) {
            impl_->conn->send(buildControl(impl_->session_id, signal), false);
        }
    });
    return true;
}

std::string WebsocketProtocol::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->error_mutex);
    return impl_->last_error;
}

} // namespace vtc::protocol
