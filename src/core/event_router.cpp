#include "core/event_router.hpp"
#include "mapping/glyph_converter.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace asciicam {

EventRouter::EventRouter(EventQueue& queue,
                         DeviceStateController& controller,
                         Renderer& renderer,
                         const Clock& clock,
                         RouterConfig config,
                         Settings settings)
    : queue_(queue),
      controller_(controller),
      renderer_(renderer),
      clock_(clock),
      config_(config),
      settings_(settings),
      grid_(std::make_shared<const GlyphGrid>()) {
    viewport_ = renderer_.viewport();
    next_tick_ = clock_.now() + config_.tick_interval;
}

std::chrono::nanoseconds EventRouter::time_until_tick() const {
    const auto left = std::chrono::duration_cast<std::chrono::nanoseconds>(next_tick_ - clock_.now());
    return std::max(left, std::chrono::nanoseconds(0));
}

StatusLine EventRouter::status_line() const {
    StatusLine status;
    status.camera_state = camera_state_name(controller_.state());
    status.fps = fps_;
    status.char_set = std::string(CharSet::get(settings_.char_set).name);
    status.color = settings_.color_enabled;
    status.scale = settings_.scale;
    status.message = controller_.status_message();
    if (controller_.state() == CameraState::Stopped) status.hint = config_.idle_hint;
    return status;
}

bool EventRouter::run_once(std::chrono::nanoseconds max_wait) {
    ++stats_.iterations;
    std::vector<Event> events = queue_.drain(max_wait);
    const Clock::time_point now = clock_.now();

    if (now >= next_tick_) {
        events.emplace_back(TickEvent{});
        next_tick_ = now + config_.tick_interval;
    }

    // Control events are applied in arrival order; frames only compete for
    // the newest slot and are looked at after all control work is done.
    std::optional<Frame> latest;
    uint64_t batch_frames = 0;
    for (auto& ev : events) {
        if (auto* cmd = std::get_if<ControlCommand>(&ev)) {
            ++stats_.commands;
            apply_command(*cmd);
        } else if (auto* ack = std::get_if<DeviceAck>(&ev)) {
            controller_.handle_ack(*ack);
        } else if (std::holds_alternative<TickEvent>(ev)) {
            on_tick(now);
        } else if (auto* fe = std::get_if<FrameEvent>(&ev)) {
            ++batch_frames;
            latest = std::move(fe->frame);
        }
    }
    stats_.frames_received += batch_frames;

    if (quit_) {
        if (config_.verbose) {
            std::cerr << "[router] quit, dropping " << batch_frames << " unprocessed frame(s)\n";
        }
        return false;
    }

    if (controller_.state() != CameraState::Active) {
        stats_.frames_discarded += batch_frames;
        drop_picture();
    } else if (latest) {
        stats_.frames_coalesced += batch_frames - 1;
        if (pending_) ++stats_.frames_coalesced;
        pending_ = std::move(latest);
    }

    const bool render_due = !last_render_ || now - *last_render_ >= config_.render_interval;
    if (render_due) {
        if (pending_) {
            Frame frame = std::move(*pending_);
            pending_.reset();
            last_render_ = now;
            if (convert(frame, now)) {
                last_frame_ = std::move(frame);
            }
            reconvert_ = false;
        } else if (reconvert_) {
            if (last_frame_) {
                last_render_ = now;
                convert(*last_frame_, now);
            }
            reconvert_ = false;
        }
    }

    const StatusLine status = status_line();
    if (grid_changed_ || !drawn_status_ || *drawn_status_ != status) {
        draw(status);
    }
    return true;
}

void EventRouter::run() {
    while (true) {
        std::chrono::nanoseconds wait = time_until_tick();
        if ((pending_ || reconvert_) && last_render_) {
            const auto until_render = std::chrono::duration_cast<std::chrono::nanoseconds>(
                *last_render_ + config_.render_interval - clock_.now());
            wait = std::min(wait, std::max(until_render, std::chrono::nanoseconds(0)));
        }
        if (!run_once(wait)) break;
    }
}

void EventRouter::apply_command(ControlCommand cmd) {
    if (config_.verbose) {
        std::cerr << "[router] command " << command_name(cmd) << "\n";
    }
    Result r = Result::ok();
    switch (cmd) {
        case ControlCommand::ToggleCamera:
            r = controller_.toggle();
            break;
        case ControlCommand::ForceStopCamera:
            r = controller_.request_force_stop();
            break;
        case ControlCommand::ResetCamera:
            r = controller_.request_reset();
            break;
        case ControlCommand::ToggleColor:
            settings_.toggle_color();
            reconvert_ = true;
            break;
        case ControlCommand::NextCharacterSet:
            settings_.next_char_set();
            reconvert_ = true;
            break;
        case ControlCommand::PreviousCharacterSet:
            settings_.previous_char_set();
            reconvert_ = true;
            break;
        case ControlCommand::IncreaseScale:
            settings_.increase_scale();
            reconvert_ = true;
            break;
        case ControlCommand::DecreaseScale:
            settings_.decrease_scale();
            reconvert_ = true;
            break;
        case ControlCommand::Quit:
            quit_ = true;
            break;
    }
    if (r.failure() && config_.verbose) {
        std::cerr << "[router] " << command_name(cmd) << " rejected: " << r.message << "\n";
    }
}

void EventRouter::on_tick(Clock::time_point now) {
    ++stats_.ticks;
    const Size vp = renderer_.viewport();
    if (vp != viewport_) {
        if (config_.verbose) {
            std::cerr << "[router] viewport " << viewport_.width << "x" << viewport_.height
                      << " -> " << vp.width << "x" << vp.height << "\n";
        }
        viewport_ = vp;
        reconvert_ = true;
    }
    fps_ = fps_counter_.fps(now);
}

void EventRouter::drop_picture() {
    pending_.reset();
    last_frame_.reset();
    reconvert_ = false;
    if (!grid_->empty()) {
        grid_ = std::make_shared<const GlyphGrid>();
        grid_changed_ = true;
        fps_counter_.reset();
        fps_ = 0.0;
    }
}

bool EventRouter::convert(const Frame& frame, Clock::time_point now) {
    const Size target = scaled_grid_size(viewport_, settings_.scale);
    GlyphGrid out;
    Result r = convert_frame(frame, target.height, target.width,
                             CharSet::get(settings_.char_set), settings_.color_enabled, out);
    if (r.failure()) {
        ++stats_.conversion_failures;
        std::cerr << "Warning: [router] dropped frame: " << r.message << "\n";
        return false;
    }
    grid_ = std::make_shared<const GlyphGrid>(std::move(out));
    grid_changed_ = true;
    ++stats_.conversions;
    fps_counter_.record(now);
    return true;
}

void EventRouter::draw(const StatusLine& status) {
    renderer_.render(*grid_, status);
    drawn_status_ = status;
    grid_changed_ = false;
    ++stats_.renders;
}

}
