#pragma once

#include "capture/device_state.hpp"
#include "core/clock.hpp"
#include "core/event_queue.hpp"
#include "core/fps_counter.hpp"
#include "core/settings.hpp"
#include "render/renderer.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace asciicam {

struct RouterConfig {
    std::chrono::nanoseconds tick_interval = std::chrono::milliseconds(250);
    std::chrono::nanoseconds render_interval = std::chrono::nanoseconds(33333333);
    bool verbose = false;
    // Shown in the status line while the camera is stopped.
    std::string idle_hint;
};

struct RouterStats {
    uint64_t iterations = 0;
    uint64_t commands = 0;
    uint64_t ticks = 0;
    uint64_t frames_received = 0;
    uint64_t frames_coalesced = 0;
    uint64_t frames_discarded = 0;
    uint64_t conversions = 0;
    uint64_t conversion_failures = 0;
    uint64_t renders = 0;
};

// The single control loop. Each iteration drains the queue, applies every
// control event in arrival order, then considers only the newest frame. The
// newest frame waits in a one-slot buffer until the render interval allows a
// conversion; a newer arrival replaces it. Once quit is seen no frame is
// touched again.
class EventRouter {
public:
    EventRouter(EventQueue& queue,
                DeviceStateController& controller,
                Renderer& renderer,
                const Clock& clock,
                RouterConfig config,
                Settings settings);

    // One iteration, waiting at most `max_wait` for the first event.
    // Returns false once quit has been processed.
    bool run_once(std::chrono::nanoseconds max_wait);

    // Loops until quit. Never blocks longer than the time to the next tick.
    void run();

    std::chrono::nanoseconds time_until_tick() const;

    std::shared_ptr<const GlyphGrid> current_grid() const { return grid_; }
    const Settings& settings() const { return settings_; }
    const RouterStats& stats() const { return stats_; }
    bool quit_requested() const { return quit_; }
    bool has_pending_frame() const { return pending_.has_value(); }
    Size viewport() const { return viewport_; }
    StatusLine status_line() const;

private:
    EventQueue& queue_;
    DeviceStateController& controller_;
    Renderer& renderer_;
    const Clock& clock_;
    RouterConfig config_;
    Settings settings_;

    std::shared_ptr<const GlyphGrid> grid_;
    std::optional<Frame> pending_;
    // Last converted frame, kept so a settings change can redraw without
    // waiting for the camera.
    std::optional<Frame> last_frame_;
    bool reconvert_ = false;
    bool grid_changed_ = false;

    Size viewport_;
    Clock::time_point next_tick_;
    std::optional<Clock::time_point> last_render_;
    FpsCounter fps_counter_;
    double fps_ = 0.0;
    std::optional<StatusLine> drawn_status_;
    RouterStats stats_;
    bool quit_ = false;

    void apply_command(ControlCommand cmd);
    void on_tick(Clock::time_point now);
    void drop_picture();
    bool convert(const Frame& frame, Clock::time_point now);
    void draw(const StatusLine& status);
};

}
