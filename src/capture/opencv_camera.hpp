#pragma once

#include "capture/camera_device.hpp"
#include <memory>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace asciicam {

class OpenCVCameraDevice : public CameraDevice {
public:
    OpenCVCameraDevice();
    ~OpenCVCameraDevice() override;

    Result initialize() override;
    Result open(const CameraRequest& request) override;
    Result stop_stream() override;
    Result read(Frame& out) override;
    bool is_streaming() const override;
    Result reinitialize() override;
    void close() override;

private:
    std::unique_ptr<cv::VideoCapture> cap_;
    cv::Mat scratch_;
    Size size_;
    double fps_ = 30.0;

    static void convert_mat_to_frame(const cv::Mat& mat, Frame& out);
};

}
