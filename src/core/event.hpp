#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace asciicam {

enum class ControlCommand {
    ToggleCamera,
    ToggleColor,
    NextCharacterSet,
    PreviousCharacterSet,
    IncreaseScale,
    DecreaseScale,
    ForceStopCamera,
    ResetCamera,
    Quit
};

const char* command_name(ControlCommand cmd);
std::optional<ControlCommand> parse_command_name(const std::string& name);

enum class DeviceOp {
    Start,
    Stop,
    ForceStop,
    Reset
};

const char* device_op_name(DeviceOp op);

// Completion report for one hardware operation, produced on the capture thread.
struct DeviceAck {
    DeviceOp op = DeviceOp::Start;
    uint64_t op_id = 0;
    bool ok = false;
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;
};

struct FrameEvent {
    Frame frame;
};

struct TickEvent {};

using Event = std::variant<ControlCommand, FrameEvent, TickEvent, DeviceAck>;

}
