#include <iostream>
#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/event_queue.hpp"
#include "../src/core/event_router.hpp"
#include "../src/capture/capture_source.hpp"
#include "../src/capture/device_state.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/mock_camera_device.hpp"
#include "mocks/recording_renderer.hpp"

using namespace asciicam;
using namespace std::chrono_literals;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

namespace {

constexpr uint32_t kFullBlock = 0x2588;

// The mock camera never produces frames here; tests push them directly so the
// router sees exactly the batches they describe.
struct Rig {
    std::shared_ptr<mocks::CameraScript> script = std::make_shared<mocks::CameraScript>();
    EventQueue queue;
    std::unique_ptr<DeviceStateController> controller;
    mocks::ManualClock clock;
    mocks::RecordingRenderer renderer;
    std::unique_ptr<EventRouter> router;

    explicit Rig(RouterConfig cfg = RouterConfig{}) {
        script->edit([](mocks::CameraScript& s) { s.read_fails = true; });
        CaptureConfig capture;
        capture.read_retry_delay = 5ms;
        capture.retry_backoff = 1ms;
        auto source = std::make_unique<CaptureSource>(
            std::make_unique<mocks::MockCameraDevice>(script),
            std::make_shared<SteadyClock>(), capture);
        source->set_sinks(
            [this](Frame f) { queue.push(FrameEvent{std::move(f)}); },
            [this](DeviceAck a) { queue.push(std::move(a)); });
        controller = std::make_unique<DeviceStateController>(std::move(source));
        router = std::make_unique<EventRouter>(queue, *controller, renderer, clock, cfg, Settings{});
    }

    ~Rig() {
        router.reset();
        controller->shutdown(1000ms);
    }

    // Runs iterations until `done` holds, feeding real acks through the queue.
    template <typename Pred>
    bool run_until(Pred done, int max_iterations = 200) {
        for (int i = 0; i < max_iterations; ++i) {
            if (done()) return true;
            router->run_once(10ms);
        }
        return done();
    }

    void activate() {
        queue.push(ControlCommand::ToggleCamera);
        assert(run_until([this] { return controller->state() == CameraState::Active; }));
    }

    void push_frame(uint8_t brightness, int w = 64, int h = 48) {
        queue.push(FrameEvent{Frame(w, h, Color(brightness, brightness, brightness))});
    }
};

bool grid_all(const GlyphGrid& grid, uint32_t cp) {
    if (grid.empty()) return false;
    for (const auto& cell : grid.cells()) {
        if (cell.codepoint != cp) return false;
    }
    return true;
}

}

TEST(commands_apply_before_frames) {
    Rig rig;
    rig.activate();

    for (int i = 0; i < 10; ++i) rig.push_frame(255);
    rig.queue.push(ControlCommand::PreviousCharacterSet);

    assert(rig.router->run_once(0ns));
    const auto& stats = rig.router->stats();
    assert(stats.conversions == 1);
    assert(stats.frames_received == 10);
    assert(stats.frames_coalesced == 9);
    assert(rig.router->settings().char_set == CharSetId::Minimal);

    auto grid = rig.router->current_grid();
    assert(grid->rows() == 24 && grid->cols() == 80);
    assert(grid_all(*grid, kFullBlock));
    assert(grid_all(rig.renderer.last_grid, kFullBlock));
}

TEST(newest_frame_replaces_pending_one) {
    RouterConfig cfg;
    cfg.render_interval = 100ms;
    Rig rig(cfg);
    rig.activate();

    rig.push_frame(0);
    assert(rig.router->run_once(0ns));
    assert(rig.router->stats().conversions == 1);

    rig.clock.advance(10ms);
    rig.push_frame(0);
    assert(rig.router->run_once(0ns));
    assert(rig.router->has_pending_frame());
    assert(rig.router->stats().conversions == 1);

    rig.push_frame(255);
    assert(rig.router->run_once(0ns));
    assert(rig.router->stats().frames_coalesced == 1);
    assert(rig.router->stats().conversions == 1);

    rig.clock.advance(100ms);
    assert(rig.router->run_once(0ns));
    assert(!rig.router->has_pending_frame());
    assert(rig.router->stats().conversions == 2);
    // The brightest frame was the one kept.
    const auto& dense = CharSet::get(CharSetId::Dense);
    assert(grid_all(*rig.router->current_grid(), dense.glyphs.back()));
}

TEST(quit_skips_remaining_frames) {
    Rig rig;
    rig.activate();

    rig.queue.push(ControlCommand::Quit);
    rig.push_frame(255);
    rig.push_frame(255);

    assert(!rig.router->run_once(0ns));
    assert(rig.queue.empty());
    assert(rig.router->quit_requested());
    assert(rig.router->stats().conversions == 0);
    assert(rig.router->current_grid()->empty());
}

TEST(frames_ignored_when_camera_not_active) {
    Rig rig;
    rig.push_frame(255);
    assert(rig.router->run_once(0ns));
    assert(rig.router->stats().frames_discarded == 1);
    assert(rig.router->stats().conversions == 0);
    assert(!rig.router->has_pending_frame());
    assert(rig.router->current_grid()->empty());
}

TEST(malformed_frame_keeps_previous_grid) {
    Rig rig;
    rig.activate();

    rig.push_frame(255);
    assert(rig.router->run_once(0ns));
    auto before = rig.router->current_grid();
    assert(!before->empty());

    rig.clock.advance(40ms);
    rig.queue.push(FrameEvent{Frame(10, 10, 3, std::vector<uint8_t>(17, 0))});
    assert(rig.router->run_once(0ns));
    assert(rig.router->stats().conversion_failures == 1);
    assert(rig.router->current_grid() == before);
}

TEST(settings_change_reconverts_last_frame) {
    Rig rig;
    rig.activate();

    rig.push_frame(255);
    assert(rig.router->run_once(0ns));
    assert(!rig.router->current_grid()->at(0, 0).has_color);

    rig.clock.advance(40ms);
    rig.queue.push(ControlCommand::ToggleColor);
    assert(rig.router->run_once(0ns));
    assert(rig.router->stats().conversions == 2);
    assert(rig.router->settings().color_enabled);
    assert(rig.router->current_grid()->at(0, 0).has_color);
    assert(rig.renderer.last_status.color);
}

TEST(scale_shrinks_grid) {
    Rig rig;
    rig.activate();
    for (int i = 0; i < 5; ++i) rig.queue.push(ControlCommand::DecreaseScale);
    rig.push_frame(128);
    assert(rig.router->run_once(0ns));

    auto grid = rig.router->current_grid();
    assert(grid->cols() == 40);
    assert(grid->rows() == 12);
}

TEST(grid_cleared_when_camera_stops) {
    Rig rig;
    rig.activate();
    rig.push_frame(255);
    assert(rig.router->run_once(0ns));
    assert(!rig.router->current_grid()->empty());

    rig.queue.push(ControlCommand::ToggleCamera);
    assert(rig.router->run_once(0ns));
    assert(rig.controller->state() == CameraState::Stopping);
    assert(rig.router->current_grid()->empty());
    assert(rig.renderer.last_grid.empty());

    assert(rig.run_until([&] { return rig.controller->state() == CameraState::Stopped; }));
}

TEST(viewport_tracked_on_tick) {
    Rig rig;
    rig.activate();
    rig.push_frame(255);
    assert(rig.router->run_once(0ns));
    assert(rig.router->current_grid()->cols() == 80);

    rig.renderer.set_viewport({100, 30});
    rig.clock.advance(300ms);
    assert(rig.router->run_once(0ns));
    assert(rig.router->stats().ticks >= 1);
    assert(rig.router->viewport() == (Size{100, 30}));

    auto grid = rig.router->current_grid();
    assert(grid->cols() == 100);
    assert(grid->rows() == 30);
}

TEST(tick_fires_without_events) {
    Rig rig;
    assert(rig.router->time_until_tick() == 250ms);
    rig.clock.advance(100ms);
    assert(rig.router->time_until_tick() == 150ms);
    rig.clock.advance(200ms);
    assert(rig.router->time_until_tick() == 0ns);
    assert(rig.router->run_once(0ns));
    assert(rig.router->stats().ticks == 1);
    assert(rig.router->time_until_tick() == 250ms);
}

TEST(status_line_reflects_state) {
    Rig rig;
    assert(rig.router->run_once(0ns));
    assert(rig.renderer.render_calls >= 1);
    assert(rig.renderer.last_status.camera_state == "stopped");
    assert(rig.renderer.last_status.char_set == "Dense");

    rig.activate();
    assert(rig.renderer.last_status.camera_state == "active");
    assert(rig.renderer.last_status.message == "Camera active");

    // Nothing changed, nothing drawn.
    const int calls = rig.renderer.render_calls;
    assert(rig.router->run_once(0ns));
    assert(rig.renderer.render_calls == calls);
}

TEST(idle_hint_shown_only_while_stopped) {
    RouterConfig cfg;
    cfg.idle_hint = "Press space to start camera";
    Rig rig(cfg);
    assert(rig.router->run_once(0ns));
    assert(rig.renderer.last_status.hint == "Press space to start camera");

    rig.activate();
    assert(rig.renderer.last_status.hint.empty());
}

TEST(rejected_command_reaches_status) {
    Rig rig;
    rig.queue.push(ControlCommand::ToggleCamera);
    rig.queue.push(ControlCommand::ToggleCamera);
    assert(rig.router->run_once(0ns));
    assert(rig.renderer.last_status.message.find("busy") != std::string::npos);
    assert(rig.run_until([&] { return rig.controller->state() == CameraState::Active; }));
}

int main() {
    std::cout << "=== Event Router Tests ===\n\n";

    std::cout << "--- Ordering ---\n";
    RUN_TEST(commands_apply_before_frames);
    RUN_TEST(newest_frame_replaces_pending_one);
    RUN_TEST(quit_skips_remaining_frames);
    RUN_TEST(frames_ignored_when_camera_not_active);
    RUN_TEST(malformed_frame_keeps_previous_grid);

    std::cout << "\n--- Settings ---\n";
    RUN_TEST(settings_change_reconverts_last_frame);
    RUN_TEST(scale_shrinks_grid);
    RUN_TEST(grid_cleared_when_camera_stops);
    RUN_TEST(viewport_tracked_on_tick);
    RUN_TEST(tick_fires_without_events);

    std::cout << "\n--- Status ---\n";
    RUN_TEST(status_line_reflects_state);
    RUN_TEST(idle_hint_shown_only_while_stopped);
    RUN_TEST(rejected_command_reaches_status);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\n✓ All tests passed!\n";
        return 0;
    } else {
        std::cout << "\n✗ Some tests failed!\n";
        return 1;
    }
}
