#pragma once

/**
 * OpenCvCamera.hpp - CameraDevice backed by cv::VideoCapture
 */

#include "vtc/camera/CameraDevice.hpp"

#include <memory>

namespace vtc::camera {

struct OpenCvCameraOptions {
    int frame_width = 640;
    int frame_height = 480;
    int max_image_size = 800;  // longest side after downscaling
    int jpeg_quality = 80;
    int read_attempts = 3;
};

class OpenCvCamera : public CameraDevice {
public:
    explicit OpenCvCamera(OpenCvCameraOptions options = {});
    ~OpenCvCamera() override;

    bool open(int index) override;
    void close() override;
    bool isOpen() const override;
    bool read(Frame& out) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vtc::camera
