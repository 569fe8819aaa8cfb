#pragma once

/**
 * CameraController.hpp - Serialized, idempotent camera open/close/capture
 */

#include "vtc/camera/CameraDevice.hpp"
#include "vtc/core/Types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vtc::camera {

class CameraController {
public:
    /// Called when a fallback index worked instead of the configured one.
    using IndexChangedCallback = std::function<void(int index)>;

    CameraController(std::unique_ptr<CameraDevice> device,
                     int index,
                     std::vector<int> fallback_indices = {0, 1});
    ~CameraController();

    CameraController(const CameraController&) = delete;
    CameraController& operator=(const CameraController&) = delete;

    /**
     * Open the configured camera, falling back to the alternative indices.
     * Opening an open camera returns the same handle.
     * @return nullopt on DeviceUnavailable (see lastError())
     */
    std::optional<CameraHandle> open();

    /// Always succeeds. No-op when already closed.
    void close();

    /**
     * Capture one frame, opening the camera first if needed.
     * A raised cancel flag is checked under the camera lock, so a capture
     * cancelled before a close() never reopens the device.
     */
    CaptureResult captureFrame(const std::atomic<bool>* cancel = nullptr);

    bool isOpen() const;
    int index() const;
    std::string lastError() const;

    void setIndexChangedCallback(IndexChangedCallback callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vtc::camera
