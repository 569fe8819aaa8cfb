/**
 * VisionApiClient.cpp - HTTP client for GLM-4V style vision endpoints
 *
 * The answer is streamed (SSE) and accumulated; only the complete text is
 * returned since it is spoken and forwarded as one utterance.
 */

#include "vtc/vision/VisionApiClient.hpp"
#include "vtc/vision/VisionPayload.hpp"

#include <iostream>
#include <mutex>

#include <httplib.h>

namespace vtc::vision {

using Clock = std::chrono::steady_clock;

struct VisionApiClient::Impl {
    VisionApiOptions options;
    std::optional<HttpEndpoint> endpoint;

    mutable std::mutex error_mutex;
    std::string last_error;

    void setError(const std::string& error) {
        std::lock_guard<std::mutex> lock(error_mutex);
        last_error = error;
        std::cerr << "[VisionApi] " << error << std::endl;
    }

    VisionResult fail(ErrorKind kind, const std::string& error) {
        setError(error);
        return VisionResult::failure(kind);
    }
};

VisionApiClient::VisionApiClient(VisionApiOptions options)
    : impl_(std::make_unique<Impl>()) {
    impl_->options = std::move(options);
    impl_->endpoint = splitHttpUrl(impl_->options.api_url);

    if (!impl_->endpoint) {
        std::cerr << "[VisionApi] Invalid API URL: " << impl_->options.api_url << std::endl;
    } else {
        std::cout << "[VisionApi] Using " << impl_->endpoint->base << impl_->endpoint->path
                  << " (" << impl_->options.model << ")" << std::endl;
    }
    if (impl_->options.api_key.empty()) {
        std::cerr << "[VisionApi] Warning: no API key configured" << std::endl;
    }
}

VisionApiClient::~VisionApiClient() = default;

VisionResult VisionApiClient::analyze(const VisionRequest& request,
                                      std::chrono::milliseconds timeout,
                                      const std::atomic<bool>* cancel) {
    if (!impl_->endpoint) {
        return impl_->fail(ErrorKind::AnalysisNetwork, "invalid API URL");
    }
    if (request.frame.empty()) {
        return impl_->fail(ErrorKind::CaptureFailed, "empty frame");
    }

    auto cancelled = [cancel]() { return cancel && cancel->load(); };
    auto deadline = Clock::now() + timeout;
    auto expired = [deadline]() { return Clock::now() >= deadline; };

    httplib::Client client(impl_->endpoint->base);
    long ms = static_cast<long>(timeout.count());
    client.set_connection_timeout(ms / 1000, (ms % 1000) * 1000);
    client.set_read_timeout(ms / 1000, (ms % 1000) * 1000);
    client.set_write_timeout(ms / 1000, (ms % 1000) * 1000);

    SseAccumulator sse;
    bool timed_out = false;

    httplib::Request req;
    req.method = "POST";
    req.path = impl_->endpoint->path;
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", "text/event-stream");
    req.set_header("Authorization", "Bearer " + impl_->options.api_key);
    req.body = buildRequestBody(impl_->options.model, request, true);

    // Called as data arrives; returning false aborts the transfer
    req.content_receiver = [&](const char* data, size_t data_length,
                               uint64_t /*offset*/, uint64_t /*total_length*/) -> bool {
        if (cancelled()) return false;
        if (expired()) {
            timed_out = true;
            return false;
        }
        sse.feed(data, data_length);
        return !sse.done();
    };
    req.progress = [&](uint64_t, uint64_t) -> bool {
        if (expired()) timed_out = true;
        return !cancelled() && !timed_out;
    };

    std::cout << "[VisionApi] Analyzing " << request.frame.jpeg.size() << " byte frame..." << std::endl;
    auto start = Clock::now();
    auto result = client.send(req);

    if (cancelled()) {
        std::cout << "[VisionApi] Request cancelled" << std::endl;
        return VisionResult::failure(ErrorKind::Cancelled);
    }

    // A receiver that stopped on [DONE] still counts as a complete answer
    sse.finish();
    bool complete = sse.done() && !sse.text().empty();

    if (!complete) {
        if (timed_out || expired()) {
            return impl_->fail(ErrorKind::AnalysisTimeout,
                               "no answer within " + std::to_string(timeout.count()) + " ms");
        }
        if (!result) {
            return impl_->fail(ErrorKind::AnalysisNetwork,
                               "request failed: " + httplib::to_string(result.error()));
        }
        if (result->status != 200) {
            return impl_->fail(ErrorKind::AnalysisNetwork,
                               "HTTP " + std::to_string(result->status) + ": " + sse.raw().substr(0, 200));
        }
    }

    if (sse.text().empty()) {
        return impl_->fail(ErrorKind::AnalysisMalformedResponse,
                           "no content in response (" + std::to_string(sse.badEvents()) + " bad events)");
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    std::cout << "[VisionApi] Answer (" << elapsed.count() << " ms): " << sse.text() << std::endl;
    return VisionResult::ok(sse.text());
}

std::string VisionApiClient::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->error_mutex);
    return impl_->last_error;
}

} // namespace vtc::vision
