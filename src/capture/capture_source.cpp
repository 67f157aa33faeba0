#include "capture_source.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <string>

namespace asciicam {

namespace {

constexpr size_t kAckHistory = 16;

struct Command {
    DeviceOp op = DeviceOp::Start;
    uint64_t id = 0;
};

}

// State shared between the owning object and the worker. The worker holds its
// own reference so an abandoned worker never touches freed memory.
struct CaptureSource::Shared {
    std::unique_ptr<CameraDevice> device;
    std::shared_ptr<const Clock> clock;
    CaptureConfig config;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Command> commands;
    std::deque<DeviceAck> acks;
    uint64_t next_op_id = 1;
    bool streaming = false;
    bool exit = false;
    bool finished = false;

    std::mutex publish_mutex;
    FrameSink frame_sink;
    AckSink ack_sink;

    std::atomic<uint64_t> frames_published{0};
    std::atomic<uint64_t> frames_skipped{0};
    std::atomic<uint64_t> read_failures{0};
};

namespace {

using Shared = CaptureSource::Shared;

void set_streaming(Shared& s, bool value) {
    std::lock_guard<std::mutex> lock(s.mutex);
    s.streaming = value;
}

// Sleeps for `d` unless a command or exit request arrives first.
void interruptible_wait(Shared& s, std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(s.mutex);
    s.cv.wait_for(lock, d, [&s] { return s.exit || !s.commands.empty(); });
}

DeviceAck make_ack(const Command& cmd, const Result& r) {
    DeviceAck ack;
    ack.op = cmd.op;
    ack.op_id = cmd.id;
    ack.ok = r.success();
    ack.error = r.error;
    ack.message = r.message;
    return ack;
}

Result do_start(Shared& s) {
    // A previous failed stop can leave a stream behind; clear it before opening.
    Result lingering = s.device->stop_stream();
    if (lingering.failure() && lingering.error != ErrorCode::DEVICE_NOT_RUNNING) {
        std::cerr << "Warning: [camera] could not clear lingering stream: " << lingering.message << "\n";
    }

    Result r = s.device->open(s.config.request);
    if (r.success()) set_streaming(s, true);
    return r;
}

Result do_stop(Shared& s) {
    set_streaming(s, false);
    Result r = s.device->stop_stream();
    if (r.success() || r.error == ErrorCode::DEVICE_NOT_RUNNING) {
        return Result::ok();
    }
    // Hardware is still live; keep draining it so the state stays truthful.
    set_streaming(s, s.device->is_streaming());
    return r;
}

Result do_force_stop(Shared& s) {
    set_streaming(s, false);
    const int attempts = std::max(1, s.config.force_stop_retries);
    Result last;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        last = s.device->stop_stream();
        if (last.success() || last.error == ErrorCode::DEVICE_NOT_RUNNING) {
            return Result::ok();
        }
        std::cerr << "Warning: [camera] force stop attempt " << attempt << "/" << attempts
                  << " failed: " << last.message << "\n";
        if (attempt < attempts) {
            std::this_thread::sleep_for(s.config.retry_backoff);
        }
    }
    return Result::fail(ErrorCode::DEVICE_FAULT,
        "camera did not stop after " + std::to_string(attempts) + " attempts: " + last.message);
}

Result do_reset(Shared& s) {
    set_streaming(s, false);
    return s.device->reinitialize();
}

Result execute(Shared& s, const Command& cmd) {
    switch (cmd.op) {
        case DeviceOp::Start: return do_start(s);
        case DeviceOp::Stop: return do_stop(s);
        case DeviceOp::ForceStop: return do_force_stop(s);
        case DeviceOp::Reset: return do_reset(s);
    }
    return Result::fail(ErrorCode::INVALID_ARGUMENT, "unknown device operation");
}

void publish_ack(Shared& s, DeviceAck ack) {
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        s.acks.push_back(ack);
        while (s.acks.size() > kAckHistory) s.acks.pop_front();
    }
    s.cv.notify_all();

    std::lock_guard<std::mutex> lock(s.publish_mutex);
    if (s.ack_sink) s.ack_sink(std::move(ack));
}

void read_one(Shared& s, std::optional<Clock::time_point>& last_accepted) {
    Frame frame;
    Result r = s.device->read(frame);
    if (r.failure()) {
        s.read_failures.fetch_add(1, std::memory_order_relaxed);
        if (s.config.verbose) {
            std::cerr << "[camera] read failed: " << r.message << "\n";
        }
        interruptible_wait(s, s.config.read_retry_delay);
        return;
    }

    const Clock::time_point now = s.clock->now();
    if (last_accepted && now - *last_accepted < s.config.frame_skip_threshold) {
        s.frames_skipped.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    last_accepted = now;

    std::lock_guard<std::mutex> lock(s.publish_mutex);
    if (s.frame_sink) {
        s.frame_sink(std::move(frame));
        s.frames_published.fetch_add(1, std::memory_order_relaxed);
    }
}

void worker_main(std::shared_ptr<Shared> s) {
    std::optional<Clock::time_point> last_accepted;

    while (true) {
        std::optional<Command> cmd;
        {
            std::unique_lock<std::mutex> lock(s->mutex);
            if (!s->streaming) {
                s->cv.wait(lock, [&s] { return s->exit || !s->commands.empty(); });
            }
            if (s->exit) break;
            if (!s->commands.empty()) {
                cmd = s->commands.front();
                s->commands.pop_front();
            }
        }

        if (cmd) {
            Result r = execute(*s, *cmd);
            if (cmd->op == DeviceOp::Start && r.success()) last_accepted.reset();
            if (s->config.verbose) {
                std::cerr << "[camera] " << device_op_name(cmd->op) << " #" << cmd->id << " -> "
                          << (r.success() ? "ok" : r.message) << "\n";
            }
            publish_ack(*s, make_ack(*cmd, r));
            continue;
        }

        read_one(*s, last_accepted);
    }

    s->device->close();
    {
        std::lock_guard<std::mutex> lock(s->mutex);
        s->streaming = false;
        s->finished = true;
    }
    s->cv.notify_all();
}

}

CaptureSource::CaptureSource(std::unique_ptr<CameraDevice> device,
                             std::shared_ptr<const Clock> clock,
                             CaptureConfig config)
    : shared_(std::make_shared<Shared>()), config_(config) {
    shared_->device = std::move(device);
    shared_->clock = std::move(clock);
    shared_->config = config;
    worker_ = std::thread(worker_main, shared_);
}

CaptureSource::~CaptureSource() {
    if (!shut_down_) {
        shutdown(std::chrono::milliseconds(1000));
    }
}

void CaptureSource::set_sinks(FrameSink frames, AckSink acks) {
    std::lock_guard<std::mutex> lock(shared_->publish_mutex);
    shared_->frame_sink = std::move(frames);
    shared_->ack_sink = std::move(acks);
}

uint64_t CaptureSource::submit(DeviceOp op) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        id = shared_->next_op_id++;
        shared_->commands.push_back({op, id});
    }
    shared_->cv.notify_all();
    return id;
}

std::optional<DeviceAck> CaptureSource::wait_for_ack(uint64_t op_id, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    std::optional<DeviceAck> found;
    auto find = [&]() {
        for (const auto& ack : shared_->acks) {
            if (ack.op_id == op_id) {
                found = ack;
                return true;
            }
        }
        return shared_->finished;
    };
    shared_->cv.wait_for(lock, timeout, find);
    return found;
}

bool CaptureSource::shutdown(std::chrono::milliseconds timeout) {
    if (shut_down_) return true;
    shut_down_ = true;

    bool finished;
    {
        std::unique_lock<std::mutex> lock(shared_->mutex);
        shared_->exit = true;
        shared_->cv.notify_all();
        finished = shared_->cv.wait_for(lock, timeout, [this] { return shared_->finished; });
    }

    if (finished) {
        if (worker_.joinable()) worker_.join();
        return true;
    }

    std::cerr << "Warning: [camera] capture thread did not exit within "
              << timeout.count() << "ms, abandoning it\n";
    {
        std::lock_guard<std::mutex> lock(shared_->publish_mutex);
        shared_->frame_sink = nullptr;
        shared_->ack_sink = nullptr;
    }
    if (worker_.joinable()) worker_.detach();
    return false;
}

bool CaptureSource::streaming() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->streaming;
}

uint64_t CaptureSource::frames_published() const {
    return shared_->frames_published.load(std::memory_order_relaxed);
}

uint64_t CaptureSource::frames_skipped() const {
    return shared_->frames_skipped.load(std::memory_order_relaxed);
}

uint64_t CaptureSource::read_failures() const {
    return shared_->read_failures.load(std::memory_order_relaxed);
}

}
