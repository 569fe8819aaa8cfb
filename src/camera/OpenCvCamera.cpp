/**
 * OpenCvCamera.cpp - VideoCapture, downscale and JPEG encode
 */

#include "vtc/camera/OpenCvCamera.hpp"

#include <algorithm>
#include <iostream>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

namespace vtc::camera {

struct OpenCvCamera::Impl {
    OpenCvCameraOptions options;
    cv::VideoCapture capture;

    bool grab(cv::Mat& frame) {
        for (int attempt = 1; attempt <= options.read_attempts; ++attempt) {
            if (capture.read(frame) && !frame.empty()) return true;
            std::cerr << "[OpenCvCamera] Read failed (attempt " << attempt << "/"
                      << options.read_attempts << ")" << std::endl;
        }
        return false;
    }

    void downscale(cv::Mat& frame) const {
        int longest = std::max(frame.cols, frame.rows);
        if (options.max_image_size <= 0 || longest <= options.max_image_size) return;

        double scale = static_cast<double>(options.max_image_size) / longest;
        cv::Mat resized;
        cv::resize(frame, resized, cv::Size(), scale, scale, cv::INTER_AREA);
        frame = resized;
    }
};

OpenCvCamera::OpenCvCamera(OpenCvCameraOptions options)
    : impl_(std::make_unique<Impl>()) {
    impl_->options = options;
}

OpenCvCamera::~OpenCvCamera() { close(); }

bool OpenCvCamera::open(int index) {
    close();

    try {
        if (!impl_->capture.open(index)) {
            return false;
        }

        impl_->capture.set(cv::CAP_PROP_FRAME_WIDTH, impl_->options.frame_width);
        impl_->capture.set(cv::CAP_PROP_FRAME_HEIGHT, impl_->options.frame_height);

        // Some drivers report opened but never deliver a frame
        cv::Mat probe;
        if (!impl_->capture.read(probe) || probe.empty()) {
            std::cerr << "[OpenCvCamera] Index " << index << " opened but returns no frames" << std::endl;
            impl_->capture.release();
            return false;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[OpenCvCamera] " << e.what() << std::endl;
        impl_->capture.release();
        return false;
    }

    return true;
}

void OpenCvCamera::close() {
    if (impl_->capture.isOpened()) {
        impl_->capture.release();
    }
}

bool OpenCvCamera::isOpen() const {
    return impl_->capture.isOpened();
}

bool OpenCvCamera::read(Frame& out) {
    if (!impl_->capture.isOpened()) return false;

    try {
        cv::Mat frame;
        if (!impl_->grab(frame)) return false;

        impl_->downscale(frame);

        std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, impl_->options.jpeg_quality};
        std::vector<uchar> jpeg;
        if (!cv::imencode(".jpg", frame, jpeg, params)) {
            std::cerr << "[OpenCvCamera] JPEG encoding failed" << std::endl;
            return false;
        }

        out.jpeg.assign(jpeg.begin(), jpeg.end());
        out.width = frame.cols;
        out.height = frame.rows;
    } catch (const cv::Exception& e) {
        std::cerr << "[OpenCvCamera] " << e.what() << std::endl;
        return false;
    }

    return true;
}

} // namespace vtc::camera
