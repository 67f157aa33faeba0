#pragma once

#include "capture/camera_device.hpp"
#include "core/clock.hpp"
#include "core/event.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <thread>

namespace asciicam {

struct CaptureConfig {
    CameraRequest request;
    // Minimum spacing between two accepted frames, regardless of device rate.
    std::chrono::milliseconds frame_skip_threshold{33};
    int force_stop_retries = 3;
    std::chrono::milliseconds retry_backoff{50};
    // Pause after a failed read so an unplugged camera does not spin the thread.
    std::chrono::milliseconds read_retry_delay{100};
    bool verbose = false;
};

using FrameSink = std::function<void(Frame)>;
using AckSink = std::function<void(DeviceAck)>;

// Owns the camera device and the one thread that talks to it.
//
// Hardware operations are submitted as commands and executed in order on the
// worker; each one completes with exactly one DeviceAck delivered to the ack
// sink. Between commands the worker reads frames while streaming, drops those
// arriving closer together than the frame-skip threshold, and hands the rest
// to the frame sink. Nothing here blocks the caller on hardware.
class CaptureSource {
public:
    CaptureSource(std::unique_ptr<CameraDevice> device,
                  std::shared_ptr<const Clock> clock,
                  CaptureConfig config);
    ~CaptureSource();

    CaptureSource(const CaptureSource&) = delete;
    CaptureSource& operator=(const CaptureSource&) = delete;

    // Sinks are called from the worker thread. Set them before submitting.
    void set_sinks(FrameSink frames, AckSink acks);

    // Queues a hardware operation and returns its id.
    uint64_t submit(DeviceOp op);

    // Blocks until the ack for `op_id` exists or `timeout` passes.
    std::optional<DeviceAck> wait_for_ack(uint64_t op_id, std::chrono::milliseconds timeout);

    // Asks the worker to exit and waits at most `timeout` for it. A worker stuck
    // in a hardware call is abandoned: its sinks are cleared and it is detached.
    // Returns false when the worker had to be abandoned.
    bool shutdown(std::chrono::milliseconds timeout);

    bool streaming() const;
    uint64_t frames_published() const;
    uint64_t frames_skipped() const;
    uint64_t read_failures() const;
    const CaptureConfig& config() const { return config_; }

    struct Shared;

private:
    std::shared_ptr<Shared> shared_;
    std::thread worker_;
    CaptureConfig config_;
    bool shut_down_ = false;
};

}
