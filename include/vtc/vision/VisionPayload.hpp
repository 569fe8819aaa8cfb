#pragma once

/**
 * VisionPayload.hpp - Chat-completions request body and response parsing
 */

#include "vtc/core/Types.hpp"

#include <optional>
#include <string>

namespace vtc::vision {

/// {"model", "messages":[{image_url data URL}, {text prompt}], "stream"}
std::string buildRequestBody(const std::string& model, const VisionRequest& request, bool stream);

/// choices[0].message.content of a non-streamed response.
std::optional<std::string> parseCompletionBody(const std::string& body);

/// "https://host[:port]/path" -> {"https://host[:port]", "/path"}
struct HttpEndpoint {
    std::string base;
    std::string path;
};

std::optional<HttpEndpoint> splitHttpUrl(const std::string& url);

/**
 * Collects choices[0].delta.content from a server-sent-event stream.
 *
 * Bytes may arrive in arbitrary chunks. A body that never contained a
 * "data:" line is treated as a plain JSON response on finish().
 */
class SseAccumulator {
public:
    void feed(const char* data, size_t length);

    /// Flush a trailing line without newline and apply the non-stream fallback.
    void finish();

    const std::string& text() const { return text_; }
    const std::string& raw() const { return raw_; }

    /// "[DONE]" seen.
    bool done() const { return done_; }

    /// Number of "data:" payloads that could not be parsed.
    int badEvents() const { return bad_events_; }

private:
    void processLine(std::string line);

    std::string buffer_;
    std::string raw_;
    std::string text_;
    bool saw_event_ = false;
    bool done_ = false;
    int bad_events_ = 0;
};

} // namespace vtc::vision
