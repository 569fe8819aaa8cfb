#pragma once

/**
 * VisionApiClient.hpp - Streaming chat-completions client for vision models
 *
 * Uses cpp-httplib with Request.content_receiver for streamed responses.
 */

#include "vtc/vision/VisionAnalyzer.hpp"

#include <memory>
#include <string>

namespace vtc::vision {

struct VisionApiOptions {
    std::string api_url = "https://open.bigmodel.cn/api/paas/v4/chat/completions";
    std::string api_key;
    std::string model = "glm-4v-flash";
};

class VisionApiClient : public VisionAnalyzer {
public:
    explicit VisionApiClient(VisionApiOptions options);
    ~VisionApiClient() override;

    VisionResult analyze(const VisionRequest& request,
                         std::chrono::milliseconds timeout,
                         const std::atomic<bool>* cancel) override;

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vtc::vision
