#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/capture/camera_device.hpp"
#include "../src/capture/capture_source.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/mock_camera_device.hpp"

using namespace asciicam;
using namespace std::chrono_literals;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

namespace {

struct Collector {
    std::atomic<int> frames{0};
    std::mutex mutex;
    std::vector<DeviceAck> acks;

    void attach(CaptureSource& source) {
        source.set_sinks(
            [this](Frame) { frames++; },
            [this](DeviceAck a) {
                std::lock_guard<std::mutex> lock(mutex);
                acks.push_back(std::move(a));
            });
    }

    std::vector<DeviceAck> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return acks;
    }
};

CaptureConfig fast_config() {
    CaptureConfig cfg;
    cfg.frame_skip_threshold = 33ms;
    cfg.force_stop_retries = 3;
    cfg.retry_backoff = 1ms;
    cfg.read_retry_delay = 5ms;
    return cfg;
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

void write_node(const std::filesystem::path& root, const std::string& node, const std::string& name) {
    std::filesystem::create_directories(root / node);
    std::ofstream(root / node / "name") << name << "\n";
}

}

TEST(frames_closer_than_threshold_are_skipped) {
    auto script = std::make_shared<mocks::CameraScript>();
    auto clock = std::make_shared<mocks::ManualClock>();
    Collector sink;
    CaptureSource source(std::make_unique<mocks::MockCameraDevice>(script), clock, fast_config());
    sink.attach(source);

    const uint64_t id = source.submit(DeviceOp::Start);
    auto ack = source.wait_for_ack(id, 1000ms);
    assert(ack && ack->ok);
    assert(source.streaming());

    // The clock is frozen, so only the first read may pass.
    assert(wait_until([&] { return source.frames_skipped() >= 3; }));
    assert(source.frames_published() == 1);
    assert(sink.frames == 1);

    clock->advance(40ms);
    assert(wait_until([&] { return source.frames_published() == 2; }));
    assert(sink.frames == 2);

    assert(source.shutdown(1000ms));
}

TEST(zero_threshold_publishes_every_read) {
    auto script = std::make_shared<mocks::CameraScript>();
    auto clock = std::make_shared<mocks::ManualClock>();
    CaptureConfig cfg = fast_config();
    cfg.frame_skip_threshold = 0ms;
    Collector sink;
    CaptureSource source(std::make_unique<mocks::MockCameraDevice>(script), clock, cfg);
    sink.attach(source);

    source.submit(DeviceOp::Start);
    assert(wait_until([&] { return source.frames_published() >= 5; }));
    assert(source.frames_skipped() == 0);
    assert(source.shutdown(1000ms));
}

TEST(each_operation_acked_once_in_order) {
    auto script = std::make_shared<mocks::CameraScript>();
    Collector sink;
    CaptureSource source(std::make_unique<mocks::MockCameraDevice>(script),
                         std::make_shared<SteadyClock>(), fast_config());
    sink.attach(source);

    std::vector<uint64_t> ids;
    ids.push_back(source.submit(DeviceOp::Start));
    ids.push_back(source.submit(DeviceOp::Stop));
    ids.push_back(source.submit(DeviceOp::Start));
    ids.push_back(source.submit(DeviceOp::Stop));
    ids.push_back(source.submit(DeviceOp::Stop));

    auto last = source.wait_for_ack(ids.back(), 2000ms);
    assert(last);
    // The sink runs just after the ack is recorded.
    assert(wait_until([&] { return sink.snapshot().size() == ids.size(); }));

    const auto acks = sink.snapshot();
    assert(acks.size() == ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        assert(acks[i].op_id == ids[i]);
        assert(acks[i].ok);
    }
    assert(acks[0].op == DeviceOp::Start);
    assert(acks[1].op == DeviceOp::Stop);
    assert(!source.streaming());
    assert(script->opens() == 2);

    assert(source.shutdown(1000ms));
}

TEST(start_clears_lingering_stream) {
    auto script = std::make_shared<mocks::CameraScript>();
    script->edit([](mocks::CameraScript& s) { s.streaming = true; });
    CaptureSource source(std::make_unique<mocks::MockCameraDevice>(script),
                         std::make_shared<SteadyClock>(), fast_config());

    auto ack = source.wait_for_ack(source.submit(DeviceOp::Start), 1000ms);
    assert(ack && ack->ok);
    assert(script->stops() == 1);
    assert(script->opens() == 1);
    assert(script->is_streaming());
    assert(source.shutdown(1000ms));
}

TEST(stop_on_idle_device_succeeds) {
    auto script = std::make_shared<mocks::CameraScript>();
    CaptureSource source(std::make_unique<mocks::MockCameraDevice>(script),
                         std::make_shared<SteadyClock>(), fast_config());

    auto ack = source.wait_for_ack(source.submit(DeviceOp::Stop), 1000ms);
    assert(ack && ack->ok);
    assert(source.shutdown(1000ms));
}

TEST(failed_stop_keeps_streaming) {
    auto script = std::make_shared<mocks::CameraScript>();
    script->edit([](mocks::CameraScript& s) { s.fail_next_stops = 1; });
    CaptureSource source(std::make_unique<mocks::MockCameraDevice>(script),
                         std::make_shared<SteadyClock>(), fast_config());

    assert(source.wait_for_ack(source.submit(DeviceOp::Start), 1000ms)->ok);
    auto ack = source.wait_for_ack(source.submit(DeviceOp::Stop), 1000ms);
    assert(ack && !ack->ok);
    assert(source.streaming());

    const int reads = script->reads();
    assert(wait_until([&] { return script->reads() > reads; }));
    assert(source.shutdown(1000ms));
}

TEST(force_stop_retries_are_bounded) {
    auto script = std::make_shared<mocks::CameraScript>();
    CaptureSource source(std::make_unique<mocks::MockCameraDevice>(script),
                         std::make_shared<SteadyClock>(), fast_config());

    assert(source.wait_for_ack(source.submit(DeviceOp::Start), 1000ms)->ok);
    script->edit([](mocks::CameraScript& s) { s.stop_always_fails = true; });
    const int before = script->stops();

    auto ack = source.wait_for_ack(source.submit(DeviceOp::ForceStop), 1000ms);
    assert(ack);
    assert(!ack->ok);
    assert(ack->error == ErrorCode::DEVICE_FAULT);
    assert(ack->message.find("3 attempts") != std::string::npos);
    assert(script->stops() - before == 3);
    assert(!source.streaming());

    auto reset = source.wait_for_ack(source.submit(DeviceOp::Reset), 1000ms);
    assert(reset && reset->ok);
    assert(script->reinitializes() == 1);
    assert(source.shutdown(1000ms));
}

TEST(force_stop_succeeds_on_later_attempt) {
    auto script = std::make_shared<mocks::CameraScript>();
    CaptureSource source(std::make_unique<mocks::MockCameraDevice>(script),
                         std::make_shared<SteadyClock>(), fast_config());

    assert(source.wait_for_ack(source.submit(DeviceOp::Start), 1000ms)->ok);
    script->edit([](mocks::CameraScript& s) { s.fail_next_stops = 2; });
    const int before = script->stops();

    auto ack = source.wait_for_ack(source.submit(DeviceOp::ForceStop), 1000ms);
    assert(ack && ack->ok);
    assert(script->stops() - before == 3);
    assert(!script->is_streaming());
    assert(source.shutdown(1000ms));
}

TEST(read_failure_publishes_nothing) {
    auto script = std::make_shared<mocks::CameraScript>();
    script->edit([](mocks::CameraScript& s) { s.read_fails = true; });
    Collector sink;
    CaptureSource source(std::make_unique<mocks::MockCameraDevice>(script),
                         std::make_shared<SteadyClock>(), fast_config());
    sink.attach(source);

    assert(source.wait_for_ack(source.submit(DeviceOp::Start), 1000ms)->ok);
    assert(wait_until([&] { return source.read_failures() >= 3; }));
    assert(source.frames_published() == 0);
    assert(sink.frames == 0);
    assert(source.shutdown(1000ms));
}

TEST(shutdown_closes_device) {
    auto script = std::make_shared<mocks::CameraScript>();
    CaptureSource source(std::make_unique<mocks::MockCameraDevice>(script),
                         std::make_shared<SteadyClock>(), fast_config());

    assert(source.wait_for_ack(source.submit(DeviceOp::Start), 1000ms)->ok);
    assert(source.shutdown(1000ms));
    assert(script->closes() == 1);
    assert(!script->is_streaming());
    // Second call is a no-op.
    assert(source.shutdown(1000ms));
    assert(script->closes() == 1);
}

TEST(wait_for_unknown_ack_times_out) {
    auto script = std::make_shared<mocks::CameraScript>();
    CaptureSource source(std::make_unique<mocks::MockCameraDevice>(script),
                         std::make_shared<SteadyClock>(), fast_config());
    auto ack = source.wait_for_ack(4242, 30ms);
    assert(!ack);
    assert(source.shutdown(1000ms));
}

TEST(camera_list_skips_virtual_and_duplicates) {
    const auto root = std::filesystem::temp_directory_path() /
        ("asciicam_sysfs_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    write_node(root, "video0", "Integrated Camera");
    write_node(root, "video1", "Integrated Camera");
    write_node(root, "video2", "Dummy video device (0x0000)");
    write_node(root, "video3", "v4l2loopback Virtual Camera");
    write_node(root, "video10", "USB Cam");
    std::filesystem::create_directories(root / "vbi0");

    auto cameras = list_cameras(root.string());
    std::filesystem::remove_all(root);

    assert(cameras.size() == 2);
    assert(cameras[0].index == 0);
    assert(cameras[0].name == "Integrated Camera");
    assert(cameras[1].index == 10);
    assert(cameras[1].name == "USB Cam");
}

TEST(camera_list_missing_root_is_empty) {
    auto cameras = list_cameras("/nonexistent/asciicam/video4linux");
    assert(cameras.empty());
}

int main() {
    std::cout << "=== Capture Source Tests ===\n\n";

    std::cout << "--- Frames ---\n";
    RUN_TEST(frames_closer_than_threshold_are_skipped);
    RUN_TEST(zero_threshold_publishes_every_read);
    RUN_TEST(read_failure_publishes_nothing);

    std::cout << "\n--- Operations ---\n";
    RUN_TEST(each_operation_acked_once_in_order);
    RUN_TEST(start_clears_lingering_stream);
    RUN_TEST(stop_on_idle_device_succeeds);
    RUN_TEST(failed_stop_keeps_streaming);
    RUN_TEST(force_stop_retries_are_bounded);
    RUN_TEST(force_stop_succeeds_on_later_attempt);
    RUN_TEST(shutdown_closes_device);
    RUN_TEST(wait_for_unknown_ack_times_out);

    std::cout << "\n--- Enumeration ---\n";
    RUN_TEST(camera_list_skips_virtual_and_duplicates);
    RUN_TEST(camera_list_missing_root_is_empty);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\n✓ All tests passed!\n";
        return 0;
    } else {
        std::cout << "\n✗ Some tests failed!\n";
        return 1;
    }
}
