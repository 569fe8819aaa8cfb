#pragma once

/**
 * VisionAnalyzer.hpp - Image + prompt -> description
 */

#include "vtc/core/Types.hpp"

#include <atomic>
#include <chrono>

namespace vtc::vision {

class VisionAnalyzer {
public:
    virtual ~VisionAnalyzer() = default;

    /**
     * Blocking call, no retry.
     * Expiry of timeout gives AnalysisTimeout. When cancel becomes true the
     * call returns early with ErrorKind::Cancelled.
     */
    virtual VisionResult analyze(const VisionRequest& request,
                                 std::chrono::milliseconds timeout,
                                 const std::atomic<bool>* cancel) = 0;
};

} // namespace vtc::vision
