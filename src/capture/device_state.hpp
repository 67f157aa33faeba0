#pragma once

#include "capture/capture_source.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace asciicam {

enum class CameraState {
    Stopped,
    Starting,
    Active,
    Stopping,
    Failed
};

const char* camera_state_name(CameraState state);

// Sole owner of the capture source and of the authoritative camera state.
//
// Requests never touch hardware directly: they validate the current state,
// submit one operation to the capture worker and move to a transitional state.
// The state only settles when the matching DeviceAck comes back through
// handle_ack(). is_active() follows confirmed hardware transitions only, so it
// stays true while a stop is in flight and after a stop that failed. Acks of
// superseded operations still update it.
class DeviceStateController {
public:
    DeviceStateController(std::unique_ptr<CaptureSource> source, bool verbose = false);
    ~DeviceStateController();

    DeviceStateController(const DeviceStateController&) = delete;
    DeviceStateController& operator=(const DeviceStateController&) = delete;

    Result request_start();
    Result request_stop();
    Result request_force_stop();
    Result request_reset();

    // Start when stopped, stop when active; rejected while an op is in flight.
    Result toggle();

    void handle_ack(const DeviceAck& ack);

    CameraState state() const { return state_; }
    bool is_active() const { return hardware_active_; }
    bool has_pending_op() const { return pending_id_.has_value(); }
    const std::string& failure_reason() const { return failure_reason_; }
    const std::string& status_message() const { return status_message_; }

    // Bumped on every state or message change, so observers can redraw lazily.
    uint64_t revision() const { return revision_; }

    // Best-effort final stop for process exit. Never waits longer than `timeout`
    // for the hardware; a stuck worker is abandoned.
    Result shutdown(std::chrono::milliseconds timeout);

private:
    std::unique_ptr<CaptureSource> source_;
    bool verbose_;

    CameraState state_ = CameraState::Stopped;
    bool hardware_active_ = false;
    std::optional<uint64_t> pending_id_;
    DeviceOp pending_op_ = DeviceOp::Start;
    std::string failure_reason_;
    std::string status_message_ = "Camera stopped";
    uint64_t revision_ = 0;
    bool shut_down_ = false;

    void submit(DeviceOp op, CameraState transitional);
    void note_hardware(const DeviceAck& ack);
    void set_state(CameraState next);
    void set_message(std::string message);
    Result reject(const std::string& message);
};

}
