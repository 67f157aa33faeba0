#include "device_state.hpp"

#include <algorithm>
#include <iostream>

namespace asciicam {

const char* camera_state_name(CameraState state) {
    switch (state) {
        case CameraState::Stopped: return "stopped";
        case CameraState::Starting: return "starting";
        case CameraState::Active: return "active";
        case CameraState::Stopping: return "stopping";
        case CameraState::Failed: return "failed";
    }
    return "unknown";
}

DeviceStateController::DeviceStateController(std::unique_ptr<CaptureSource> source, bool verbose)
    : source_(std::move(source)), verbose_(verbose) {}

DeviceStateController::~DeviceStateController() {
    if (!shut_down_ && source_) {
        source_->shutdown(std::chrono::milliseconds(1000));
    }
}

void DeviceStateController::set_state(CameraState next) {
    if (next == state_) return;
    if (verbose_) {
        std::cerr << "[camera] state " << camera_state_name(state_) << " -> "
                  << camera_state_name(next) << "\n";
    }
    state_ = next;
    ++revision_;
}

void DeviceStateController::set_message(std::string message) {
    if (message == status_message_) return;
    status_message_ = std::move(message);
    ++revision_;
}

Result DeviceStateController::reject(const std::string& message) {
    set_message(message);
    return Result::fail(ErrorCode::INVALID_STATE, message);
}

void DeviceStateController::submit(DeviceOp op, CameraState transitional) {
    pending_op_ = op;
    pending_id_ = source_->submit(op);
    set_state(transitional);
}

Result DeviceStateController::request_start() {
    switch (state_) {
        case CameraState::Active:
            return Result::ok();
        case CameraState::Starting:
        case CameraState::Stopping:
            return reject("Camera busy, wait for the current operation");
        case CameraState::Failed:
            return reject("Camera fault (" + failure_reason_ + "), reset required");
        case CameraState::Stopped:
            if (pending_id_) return reject("Camera busy, wait for the current operation");
            break;
    }
    submit(DeviceOp::Start, CameraState::Starting);
    set_message("Starting camera...");
    return Result::ok();
}

Result DeviceStateController::request_stop() {
    switch (state_) {
        case CameraState::Stopped:
            return Result::ok();
        case CameraState::Starting:
        case CameraState::Stopping:
            return reject("Camera busy, wait for the current operation");
        case CameraState::Failed:
            return reject("Camera fault (" + failure_reason_ + "), reset required");
        case CameraState::Active:
            break;
    }
    submit(DeviceOp::Stop, CameraState::Stopping);
    set_message("Stopping camera...");
    return Result::ok();
}

Result DeviceStateController::request_force_stop() {
    if (state_ == CameraState::Failed) {
        return reject("Camera fault (" + failure_reason_ + "), reset required");
    }
    if (pending_id_ && pending_op_ == DeviceOp::ForceStop) {
        return reject("Force stop already in progress");
    }
    // Supersedes whatever was in flight; its ack becomes stale.
    submit(DeviceOp::ForceStop, CameraState::Stopping);
    set_message("Force stopping camera...");
    return Result::ok();
}

Result DeviceStateController::request_reset() {
    if (state_ != CameraState::Failed && state_ != CameraState::Stopped) {
        return reject(std::string("Reset not allowed while camera is ") + camera_state_name(state_));
    }
    if (pending_id_) {
        return reject("Camera busy, wait for the current operation");
    }
    submit(DeviceOp::Reset, state_);
    set_message("Resetting camera...");
    return Result::ok();
}

Result DeviceStateController::toggle() {
    if (state_ == CameraState::Active) return request_stop();
    return request_start();
}

void DeviceStateController::note_hardware(const DeviceAck& ack) {
    if (!ack.ok) return;
    hardware_active_ = ack.op == DeviceOp::Start;
}

void DeviceStateController::handle_ack(const DeviceAck& ack) {
    // Every successful ack is a hardware fact, superseded or not. Only the
    // pending one may move the state.
    note_hardware(ack);
    if (!pending_id_ || ack.op_id != *pending_id_) {
        if (verbose_) {
            std::cerr << "[camera] ignoring stale " << device_op_name(ack.op) << " ack #" << ack.op_id << "\n";
        }
        return;
    }
    pending_id_.reset();

    switch (ack.op) {
        case DeviceOp::Start:
            if (ack.ok) {
                set_state(CameraState::Active);
                set_message("Camera active");
            } else {
                set_state(CameraState::Stopped);
                set_message("Camera start failed: " + ack.message);
                std::cerr << "Error: camera start failed (" << error_code_name(ack.error) << "): "
                          << ack.message << "\n";
            }
            break;

        case DeviceOp::Stop:
            if (ack.ok) {
                set_state(CameraState::Stopped);
                set_message("Camera stopped");
            } else {
                set_state(CameraState::Active);
                set_message("Camera stop failed, still running: " + ack.message);
                std::cerr << "Error: camera stop failed (" << error_code_name(ack.error) << "): "
                          << ack.message << "\n";
            }
            break;

        case DeviceOp::ForceStop:
            if (ack.ok) {
                set_state(CameraState::Stopped);
                set_message("Camera force stopped");
            } else {
                failure_reason_ = ack.message;
                set_state(CameraState::Failed);
                set_message("Camera fault (" + failure_reason_ + "), reset required");
                std::cerr << "Error: camera force stop failed (" << error_code_name(ack.error) << "): "
                          << ack.message << "\n";
            }
            break;

        case DeviceOp::Reset:
            if (ack.ok) {
                failure_reason_.clear();
                set_state(CameraState::Stopped);
                set_message("Camera reset");
            } else {
                set_message("Camera reset failed: " + ack.message);
                std::cerr << "Error: camera reset failed (" << error_code_name(ack.error) << "): "
                          << ack.message << "\n";
            }
            break;
    }
}

Result DeviceStateController::shutdown(std::chrono::milliseconds timeout) {
    if (shut_down_) return Result::ok();
    shut_down_ = true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remaining = [&deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    };

    Result result = Result::ok();
    if (hardware_active_ || state_ == CameraState::Starting || state_ == CameraState::Stopping) {
        pending_op_ = DeviceOp::Stop;
        pending_id_ = source_->submit(DeviceOp::Stop);
        const uint64_t id = *pending_id_;
        std::optional<DeviceAck> ack = source_->wait_for_ack(id, remaining());
        if (ack) {
            handle_ack(*ack);
            if (!ack->ok) {
                result = Result::fail(ack->error, ack->message);
            }
        } else {
            result = Result::fail(ErrorCode::TIMEOUT, "camera did not acknowledge final stop in time");
        }
    }
    if (result.failure()) {
        std::cerr << "Warning: camera may still be running at exit: " << result.message << "\n";
    }

    source_->shutdown(remaining());
    return result;
}

}
