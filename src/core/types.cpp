#include "core/types.hpp"

namespace asciicam {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::INVALID_FORMAT: return "invalid format";
        case ErrorCode::PROCESSING_ERROR: return "processing error";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::INVALID_STATE: return "invalid state";
        case ErrorCode::DEVICE_ERROR: return "device error";
        case ErrorCode::DEVICE_UNAVAILABLE: return "device unavailable";
        case ErrorCode::DEVICE_NOT_RUNNING: return "device not running";
        case ErrorCode::DEVICE_FAULT: return "device fault";
        case ErrorCode::TIMEOUT: return "timeout";
    }
    return "unknown";
}

}
