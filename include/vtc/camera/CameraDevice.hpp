#pragma once

/**
 * CameraDevice.hpp - Raw camera access behind CameraController
 */

#include "vtc/core/Types.hpp"

namespace vtc::camera {

class CameraDevice {
public:
    virtual ~CameraDevice() = default;

    /// Open the device at index. False if busy or not present.
    virtual bool open(int index) = 0;

    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /// Grab one frame, JPEG encoded. False if the device returns nothing.
    virtual bool read(Frame& out) = 0;
};

} // namespace vtc::camera
