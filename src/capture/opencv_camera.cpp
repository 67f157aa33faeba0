#include "opencv_camera.hpp"

#include <cstring>
#include <iostream>
#include <string>

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio/registry.hpp>

namespace asciicam {

OpenCVCameraDevice::OpenCVCameraDevice() = default;

OpenCVCameraDevice::~OpenCVCameraDevice() {
    close();
}

void OpenCVCameraDevice::convert_mat_to_frame(const cv::Mat& mat, Frame& out) {
    if (mat.empty()) return;

    cv::Mat converted;
    int channels = 3;
    if (mat.channels() == 3) {
        cv::cvtColor(mat, converted, cv::COLOR_BGR2RGB);
    } else if (mat.channels() == 4) {
        cv::cvtColor(mat, converted, cv::COLOR_BGRA2RGB);
    } else if (mat.channels() == 1) {
        converted = mat;
        channels = 1;
    } else {
        return;
    }

    if (converted.empty() || converted.depth() != CV_8U) return;

    const int w = converted.cols;
    const int h = converted.rows;
    if (out.width() != w || out.height() != h || out.channels() != channels) {
        out = Frame(w, h, channels);
    }

    const size_t row_bytes = static_cast<size_t>(w) * channels;
    for (int y = 0; y < h; ++y) {
        std::memcpy(out.data() + static_cast<size_t>(y) * row_bytes, converted.ptr<uint8_t>(y), row_bytes);
    }
}

Result OpenCVCameraDevice::initialize() {
    try {
        const auto backends = cv::videoio_registry::getCameraBackends();
        if (backends.empty()) {
            return Result::fail(ErrorCode::DEVICE_ERROR,
                "OpenCV was built without any camera capture backend");
        }
    } catch (const cv::Exception& e) {
        return Result::fail(ErrorCode::DEVICE_ERROR, std::string("camera backend query failed: ") + e.what());
    }
    if (!cap_) {
        cap_ = std::make_unique<cv::VideoCapture>();
    }
    return Result::ok();
}

Result OpenCVCameraDevice::open(const CameraRequest& request) {
    if (!cap_) {
        return Result::fail(ErrorCode::INVALID_STATE, "camera backend not initialized");
    }
    try {
        if (!cap_->open(request.index, cv::CAP_ANY)) {
            return Result::fail(ErrorCode::DEVICE_UNAVAILABLE,
                "could not open camera " + std::to_string(request.index) +
                " (missing, busy or permission denied)");
        }

        if (request.width > 0 && request.height > 0) {
            if (!cap_->set(cv::CAP_PROP_FRAME_WIDTH, request.width) ||
                !cap_->set(cv::CAP_PROP_FRAME_HEIGHT, request.height)) {
                std::cerr << "Warning: Failed to set resolution " << request.width << "x"
                          << request.height << ", using device default\n";
            }
        }
        if (request.fps > 0.0) {
            cap_->set(cv::CAP_PROP_FPS, request.fps);
        }
        // Keep the driver queue shallow so reads return the newest frame.
        cap_->set(cv::CAP_PROP_BUFFERSIZE, 1);

        fps_ = cap_->get(cv::CAP_PROP_FPS);
        if (fps_ <= 0) fps_ = 30.0;
        size_.width = static_cast<int>(cap_->get(cv::CAP_PROP_FRAME_WIDTH));
        size_.height = static_cast<int>(cap_->get(cv::CAP_PROP_FRAME_HEIGHT));
        std::cerr << "[camera] opened " << request.index << " at " << size_.width << "x"
                  << size_.height << " @ " << fps_ << " fps\n";
    } catch (const cv::Exception& e) {
        cap_->release();
        return Result::fail(ErrorCode::DEVICE_UNAVAILABLE, std::string("camera open failed: ") + e.what());
    }
    return Result::ok();
}

Result OpenCVCameraDevice::stop_stream() {
    if (!cap_ || !cap_->isOpened()) {
        return Result::fail(ErrorCode::DEVICE_NOT_RUNNING, "camera stream was not running");
    }
    try {
        cap_->release();
    } catch (const cv::Exception& e) {
        return Result::fail(ErrorCode::DEVICE_ERROR, std::string("camera release failed: ") + e.what());
    }
    if (cap_->isOpened()) {
        return Result::fail(ErrorCode::DEVICE_FAULT, "camera still streaming after release");
    }
    return Result::ok();
}

Result OpenCVCameraDevice::read(Frame& out) {
    if (!cap_ || !cap_->isOpened()) {
        return Result::fail(ErrorCode::DEVICE_NOT_RUNNING, "camera stream is not running");
    }
    try {
        if (!cap_->read(scratch_) || scratch_.empty()) {
            return Result::fail(ErrorCode::PROCESSING_ERROR, "frame grab returned no image");
        }
    } catch (const cv::Exception& e) {
        return Result::fail(ErrorCode::DEVICE_ERROR, std::string("frame grab failed: ") + e.what());
    }
    convert_mat_to_frame(scratch_, out);
    if (out.empty()) {
        return Result::fail(ErrorCode::INVALID_FORMAT,
            "unsupported frame layout with " + std::to_string(scratch_.channels()) + " channels");
    }
    return Result::ok();
}

bool OpenCVCameraDevice::is_streaming() const {
    return cap_ && cap_->isOpened();
}

Result OpenCVCameraDevice::reinitialize() {
    close();
    cap_.reset();
    scratch_.release();
    size_ = {};
    return initialize();
}

void OpenCVCameraDevice::close() {
    if (!cap_) return;
    try {
        cap_->release();
    } catch (const cv::Exception& e) {
        std::cerr << "Warning: camera release failed during close: " << e.what() << "\n";
    }
}

}
