/**
 * test_camera_controller.cpp - Idempotent open/close, fallback, capture errors
 */

#include "vtc/camera/CameraController.hpp"
#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace vtc;
using namespace vtc::camera;

namespace {

struct FakeState {
    std::set<int> present = {0};
    int open_calls = 0;
    int close_calls = 0;
    int opened_index = -1;
    bool fail_reads = false;
};

class FakeCamera : public CameraDevice {
public:
    explicit FakeCamera(std::shared_ptr<FakeState> state) : state_(std::move(state)) {}

    bool open(int index) override {
        ++state_->open_calls;
        if (!state_->present.count(index)) return false;
        state_->opened_index = index;
        return true;
    }

    void close() override {
        ++state_->close_calls;
        state_->opened_index = -1;
    }

    bool isOpen() const override { return state_->opened_index >= 0; }

    bool read(Frame& out) override {
        if (state_->fail_reads) return false;
        out.jpeg = {0xFF, 0xD8, 0xFF, 0xD9};
        out.width = 640;
        out.height = 480;
        return true;
    }

private:
    std::shared_ptr<FakeState> state_;
};

} // anonymous namespace

void test_open_twice_same_handle() {
    auto state = std::make_shared<FakeState>();
    CameraController camera(std::make_unique<FakeCamera>(state), 0);

    auto first = camera.open();
    auto second = camera.open();
    assert(first && second);
    assert(*first == *second);
    assert(state->open_calls == 1);
    assert(camera.isOpen());

    std::cout << "[PASS] test_open_twice_same_handle" << std::endl;
}

void test_close_is_idempotent() {
    auto state = std::make_shared<FakeState>();
    CameraController camera(std::make_unique<FakeCamera>(state), 0);

    camera.close();
    assert(state->close_calls == 0);

    auto first = camera.open();
    camera.close();
    camera.close();
    assert(state->close_calls == 1);
    assert(!camera.isOpen());

    // Reopening gives a new handle
    auto again = camera.open();
    assert(again && *again != *first);

    std::cout << "[PASS] test_close_is_idempotent" << std::endl;
}

void test_index_fallback() {
    auto state = std::make_shared<FakeState>();
    state->present = {1};
    CameraController camera(std::make_unique<FakeCamera>(state), 3);

    int reported = -1;
    camera.setIndexChangedCallback([&](int index) { reported = index; });

    auto handle = camera.open();
    assert(handle && handle->index == 1);
    assert(camera.index() == 1);
    assert(reported == 1);

    std::cout << "[PASS] test_index_fallback" << std::endl;
}

void test_device_unavailable() {
    auto state = std::make_shared<FakeState>();
    state->present.clear();
    CameraController camera(std::make_unique<FakeCamera>(state), 0);

    assert(!camera.open());
    assert(!camera.lastError().empty());

    CaptureResult capture = camera.captureFrame();
    assert(!capture.ok);
    assert(capture.error == ErrorKind::DeviceUnavailable);

    std::cout << "[PASS] test_device_unavailable" << std::endl;
}

void test_capture() {
    auto state = std::make_shared<FakeState>();
    CameraController camera(std::make_unique<FakeCamera>(state), 0);

    // Capture opens on demand
    CaptureResult capture = camera.captureFrame();
    assert(capture.ok && !capture.frame.empty());
    assert(camera.isOpen());

    state->fail_reads = true;
    capture = camera.captureFrame();
    assert(!capture.ok);
    assert(capture.error == ErrorKind::CaptureFailed);
    assert(capture.frame.empty());
    // A failed read leaves the camera open
    assert(camera.isOpen());

    std::cout << "[PASS] test_capture" << std::endl;
}

void test_cancelled_capture_keeps_closed() {
    auto state = std::make_shared<FakeState>();
    CameraController camera(std::make_unique<FakeCamera>(state), 0);
    std::atomic<bool> cancel{true};

    CaptureResult capture = camera.captureFrame(&cancel);
    assert(!capture.ok);
    assert(capture.error == ErrorKind::Cancelled);
    assert(!camera.isOpen());
    assert(state->open_calls == 0);

    cancel = false;
    capture = camera.captureFrame(&cancel);
    assert(capture.ok);
    assert(camera.isOpen());

    std::cout << "[PASS] test_cancelled_capture_keeps_closed" << std::endl;
}

void test_concurrent_open() {
    auto state = std::make_shared<FakeState>();
    CameraController camera(std::make_unique<FakeCamera>(state), 0);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() { camera.open(); });
    }
    for (auto& t : threads) t.join();

    assert(state->open_calls == 1);

    std::cout << "[PASS] test_concurrent_open" << std::endl;
}

int main() {
    std::cout << "=== CameraController Tests ===" << std::endl;

    test_open_twice_same_handle();
    test_close_is_idempotent();
    test_index_fallback();
    test_device_unavailable();
    test_capture();
    test_cancelled_capture_keeps_closed();
    test_concurrent_open();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
