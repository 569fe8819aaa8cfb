/**
 * test_vision_payload.cpp - Request body, SSE accumulation, base64
 */

#include "vtc/util/Base64.hpp"
#include "vtc/vision/VisionPayload.hpp"
#include <cassert>
#include <cstring>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

using namespace vtc;
using namespace vtc::vision;
using json = nlohmann::json;

void test_base64() {
    std::vector<uint8_t> bytes = {'M', 'a', 'n'};
    assert(util::base64Encode(bytes) == "TWFu");
    assert(util::base64Encode({'M', 'a'}) == "TWE=");
    assert(util::base64Encode({'M'}) == "TQ==");
    assert(util::base64Encode({}).empty());

    auto decoded = util::base64Decode("TWE=");
    assert(decoded && decoded->size() == 2 && (*decoded)[1] == 'a');
    assert(!util::base64Decode("T$E="));

    std::cout << "[PASS] test_base64" << std::endl;
}

void test_request_body() {
    VisionRequest request;
    request.frame.jpeg = {0xFF, 0xD8, 0xFF};
    request.prompt = "这是什么";

    json body = json::parse(buildRequestBody("glm-4v-flash", request, true));
    assert(body["model"] == "glm-4v-flash");
    assert(body["stream"] == true);

    const json& content = body["messages"][0]["content"];
    assert(body["messages"][0]["role"] == "user");
    assert(content[0]["type"] == "image_url");
    assert(content[0]["image_url"]["url"] == "data:image/jpeg;base64,/9j/");
    assert(content[1]["type"] == "text");
    assert(content[1]["text"] == "这是什么");

    std::cout << "[PASS] test_request_body" << std::endl;
}

void test_sse_stream() {
    const std::string stream =
        "data: {\"choices\":[{\"delta\":{\"role\":\"assistant\"}}]}\n\n"
        "data: {\"choices\":[{\"delta\":{\"content\":\"一张\"}}]}\n\n"
        "data: {\"choices\":[{\"delta\":{\"content\":\"木桌\"}}]}\r\n\r\n"
        "data: [DONE]\n\n";

    // Feed in awkward chunk sizes
    SseAccumulator acc;
    for (size_t i = 0; i < stream.size(); i += 7) {
        size_t n = std::min<size_t>(7, stream.size() - i);
        acc.feed(stream.data() + i, n);
    }
    acc.finish();

    assert(acc.text() == "一张木桌");
    assert(acc.done());
    assert(acc.badEvents() == 0);

    std::cout << "[PASS] test_sse_stream" << std::endl;
}

void test_sse_bad_event() {
    const std::string stream =
        "data: {\"choices\":[{\"delta\":{\"content\":\"猫\"}}]}\n"
        "data: {not json}\n"
        "data: [DONE]";

    SseAccumulator acc;
    acc.feed(stream.data(), stream.size());
    acc.finish();

    assert(acc.text() == "猫");
    assert(acc.badEvents() == 1);
    assert(acc.done());  // trailing line without newline

    std::cout << "[PASS] test_sse_bad_event" << std::endl;
}

void test_non_stream_fallback() {
    const std::string body =
        R"({"choices":[{"message":{"role":"assistant","content":"一只猫"}}]})";

    SseAccumulator acc;
    acc.feed(body.data(), body.size());
    acc.finish();
    assert(acc.text() == "一只猫");

    assert(parseCompletionBody(body) == std::optional<std::string>("一只猫"));
    assert(!parseCompletionBody(R"({"choices":[]})"));
    assert(!parseCompletionBody("<html>"));

    std::cout << "[PASS] test_non_stream_fallback" << std::endl;
}

void test_split_url() {
    auto ep = splitHttpUrl("https://open.bigmodel.cn/api/paas/v4/chat/completions");
    assert(ep && ep->base == "https://open.bigmodel.cn");
    assert(ep->path == "/api/paas/v4/chat/completions");

    auto bare = splitHttpUrl("http://localhost:5050");
    assert(bare && bare->base == "http://localhost:5050" && bare->path == "/");

    assert(!splitHttpUrl("ftp://host/x"));
    assert(!splitHttpUrl("https:///path"));
    assert(!splitHttpUrl("no scheme"));

    std::cout << "[PASS] test_split_url" << std::endl;
}

int main() {
    std::cout << "=== Vision Payload Tests ===" << std::endl;

    test_base64();
    test_request_body();
    test_sse_stream();
    test_sse_bad_event();
    test_non_stream_fallback();
    test_split_url();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
