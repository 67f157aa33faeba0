#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace asciicam {

struct CameraRequest {
    int index = 0;
    int width = 640;
    int height = 480;
    double fps = 30.0;
};

// Hardware seam for the capture thread. Every call may block on the device.
// Implementations are driven from a single thread and need no locking.
class CameraDevice {
public:
    virtual ~CameraDevice() = default;

    // Prepares backend resources. Failure here means no camera can ever be opened.
    virtual Result initialize() = 0;

    // Opens the device and starts streaming.
    virtual Result open(const CameraRequest& request) = 0;

    // Stops streaming and releases the stream. Returns DEVICE_NOT_RUNNING when
    // nothing was streaming; any other failure means the device may still be live.
    virtual Result stop_stream() = 0;

    virtual Result read(Frame& out) = 0;
    virtual bool is_streaming() const = 0;

    // Tears down all backend resources and sets them up again.
    virtual Result reinitialize() = 0;

    virtual void close() = 0;
};

struct CameraInfo {
    int index = 0;
    std::string name;
};

// Lists V4L2 capture nodes, skipping duplicate names and virtual/dummy devices.
std::vector<CameraInfo> list_cameras(const std::string& sysfs_root = "/sys/class/video4linux");

}
