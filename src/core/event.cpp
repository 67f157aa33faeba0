#include "core/event.hpp"

namespace asciicam {

const char* command_name(ControlCommand cmd) {
    switch (cmd) {
        case ControlCommand::ToggleCamera: return "toggle_camera";
        case ControlCommand::ToggleColor: return "toggle_color";
        case ControlCommand::NextCharacterSet: return "next_char_set";
        case ControlCommand::PreviousCharacterSet: return "previous_char_set";
        case ControlCommand::IncreaseScale: return "increase_scale";
        case ControlCommand::DecreaseScale: return "decrease_scale";
        case ControlCommand::ForceStopCamera: return "force_stop";
        case ControlCommand::ResetCamera: return "reset_camera";
        case ControlCommand::Quit: return "quit";
    }
    return "unknown";
}

std::optional<ControlCommand> parse_command_name(const std::string& name) {
    if (name == "toggle_camera") return ControlCommand::ToggleCamera;
    if (name == "toggle_color") return ControlCommand::ToggleColor;
    if (name == "next_char_set") return ControlCommand::NextCharacterSet;
    if (name == "previous_char_set") return ControlCommand::PreviousCharacterSet;
    if (name == "increase_scale") return ControlCommand::IncreaseScale;
    if (name == "decrease_scale") return ControlCommand::DecreaseScale;
    if (name == "force_stop") return ControlCommand::ForceStopCamera;
    if (name == "reset_camera") return ControlCommand::ResetCamera;
    if (name == "quit") return ControlCommand::Quit;
    return std::nullopt;
}

const char* device_op_name(DeviceOp op) {
    switch (op) {
        case DeviceOp::Start: return "start";
        case DeviceOp::Stop: return "stop";
        case DeviceOp::ForceStop: return "force_stop";
        case DeviceOp::Reset: return "reset";
    }
    return "unknown";
}

}
