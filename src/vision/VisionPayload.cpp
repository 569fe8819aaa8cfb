/**
 * VisionPayload.cpp - OpenAI-compatible vision payloads
 */

#include "vtc/vision/VisionPayload.hpp"
#include "vtc/util/Base64.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vtc::vision {

std::string buildRequestBody(const std::string& model, const VisionRequest& request, bool stream) {
    json body = {
        {"model", model},
        {"messages", json::array({
            {
                {"role", "user"},
                {"content", json::array({
                    {
                        {"type", "image_url"},
                        {"image_url", {
                            {"url", "data:image/jpeg;base64," + util::base64Encode(request.frame.jpeg)}
                        }}
                    },
                    {
                        {"type", "text"},
                        {"text", request.prompt}
                    }
                })}
            }
        })},
        {"stream", stream}
    };
    return body.dump(-1, ' ', false);
}

std::optional<std::string> parseCompletionBody(const std::string& body) {
    try {
        json res = json::parse(body);
        const json& content = res.at("choices").at(0).at("message").at("content");
        if (!content.is_string()) return std::nullopt;
        return content.get<std::string>();
    } catch (const std::exception& e) {
        std::cerr << "[VisionPayload] Cannot parse response: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<HttpEndpoint> splitHttpUrl(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return std::nullopt;

    size_t path_start = url.find('/', scheme_end + 3);
    HttpEndpoint out;
    if (path_start == std::string::npos) {
        out.base = url;
        out.path = "/";
    } else {
        out.base = url.substr(0, path_start);
        out.path = url.substr(path_start);
    }

    if (out.base.size() <= scheme_end + 3) return std::nullopt;
    return out;
}

// ============================================================================
// SseAccumulator
// ============================================================================

void SseAccumulator::feed(const char* data, size_t length) {
    raw_.append(data, length);
    buffer_.append(data, length);

    size_t pos;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        processLine(std::move(line));
    }
}

void SseAccumulator::finish() {
    if (!buffer_.empty()) {
        processLine(std::move(buffer_));
        buffer_.clear();
    }

    if (!saw_event_ && text_.empty()) {
        // Server ignored "stream": true
        if (auto content = parseCompletionBody(raw_)) {
            text_ = *content;
        }
    }
}

void SseAccumulator::processLine(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.rfind("data:", 0) != 0) return;

    saw_event_ = true;
    std::string payload = line.substr(5);
    if (!payload.empty() && payload.front() == ' ') {
        payload.erase(0, 1);
    }

    if (payload == "[DONE]") {
        done_ = true;
        return;
    }

    try {
        json event = json::parse(payload);
        const json& choices = event.at("choices");
        if (choices.empty()) return;
        const json& delta = choices.at(0).value("delta", json::object());
        if (delta.contains("content") && delta["content"].is_string()) {
            text_ += delta["content"].get<std::string>();
        }
    } catch (const std::exception& e) {
        ++bad_events_;
        std::cerr << "[VisionPayload] Bad event: " << e.what() << " - data: "
                  << payload.substr(0, 100) << std::endl;
    }
}

} // namespace vtc::vision
