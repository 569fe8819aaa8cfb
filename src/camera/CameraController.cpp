/**
 * CameraController.cpp - Camera ownership and index fallback
 */

#include "vtc/camera/CameraController.hpp"

#include <iostream>
#include <mutex>

namespace vtc::camera {

struct CameraController::Impl {
    std::unique_ptr<CameraDevice> device;
    int index;
    std::vector<int> fallback_indices;

    mutable std::mutex mutex;
    std::optional<CameraHandle> handle;
    uint64_t generation = 0;
    std::string last_error;
    IndexChangedCallback on_index_changed;

    // Caller holds mutex
    std::optional<CameraHandle> openLocked() {
        if (handle) return handle;

        std::cout << "[Camera] Opening camera (index " << index << ")..." << std::endl;

        int opened = -1;
        if (device->open(index)) {
            opened = index;
        } else {
            std::cerr << "[Camera] Cannot open index " << index << ", trying alternatives" << std::endl;
            for (int alt : fallback_indices) {
                if (alt == index) continue;
                std::cout << "[Camera] Trying index " << alt << std::endl;
                if (device->open(alt)) {
                    opened = alt;
                    break;
                }
            }
        }

        if (opened < 0) {
            last_error = "no camera could be opened";
            std::cerr << "[Camera] " << last_error << std::endl;
            return std::nullopt;
        }

        if (opened != index) {
            std::cout << "[Camera] Using index " << opened << " from now on" << std::endl;
            index = opened;
            if (on_index_changed) on_index_changed(opened);
        }

        handle = CameraHandle{opened, ++generation};
        last_error.clear();
        std::cout << "[Camera] Camera " << opened << " open" << std::endl;
        return handle;
    }
};

CameraController::CameraController(std::unique_ptr<CameraDevice> device,
                                   int index,
                                   std::vector<int> fallback_indices)
    : impl_(std::make_unique<Impl>()) {
    impl_->device = std::move(device);
    impl_->index = index;
    impl_->fallback_indices = std::move(fallback_indices);
}

CameraController::~CameraController() { close(); }

std::optional<CameraHandle> CameraController::open() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->openLocked();
}

void CameraController::close() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->handle) return;

    impl_->device->close();
    impl_->handle.reset();
    std::cout << "[Camera] Camera closed" << std::endl;
}

CaptureResult CameraController::captureFrame(const std::atomic<bool>* cancel) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    CaptureResult result;
    if (cancel && *cancel) {
        result.error = ErrorKind::Cancelled;
        return result;
    }
    if (!impl_->openLocked()) {
        result.error = ErrorKind::DeviceUnavailable;
        return result;
    }

    if (!impl_->device->read(result.frame) || result.frame.empty()) {
        impl_->last_error = "camera returned no frame";
        std::cerr << "[Camera] " << impl_->last_error << std::endl;
        result.frame = Frame{};
        result.error = ErrorKind::CaptureFailed;
        return result;
    }

    result.ok = true;
    return result;
}

bool CameraController::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->handle.has_value();
}

int CameraController::index() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->index;
}

std::string CameraController::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_error;
}

void CameraController::setIndexChangedCallback(IndexChangedCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->on_index_changed = std::move(callback);
}

} // namespace vtc::camera
