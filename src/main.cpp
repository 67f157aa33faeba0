#include "core/types.hpp"
#include "core/config.hpp"
#include "core/clock.hpp"
#include "core/event_queue.hpp"
#include "core/event_router.hpp"
#include "capture/camera_device.hpp"
#include "capture/opencv_camera.hpp"
#include "capture/capture_source.hpp"
#include "capture/device_state.hpp"
#include "input/key_map.hpp"
#include "render/terminal_renderer.hpp"
#include "terminal/keyboard.hpp"
#include "terminal/terminal.hpp"
#include "cli/args.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_sigint(int) {
    g_interrupted = 1;
}

int print_cameras() {
    auto cameras = asciicam::list_cameras();
    if (cameras.empty()) {
        std::cout << "No cameras found.\n";
        return 0;
    }
    for (const auto& cam : cameras) {
        std::cout << cam.index << ": " << cam.name << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    asciicam::Args args = asciicam::parse_args(argc, argv);

    if (args.show_help) {
        asciicam::print_help(argv[0]);
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        asciicam::print_help(argv[0]);
        return 1;
    }
    if (args.list_cameras) {
        return print_cameras();
    }

    asciicam::Config config = asciicam::Config::defaults();
    if (!args.config_path.empty()) {
        auto loaded = asciicam::Config::load(args.config_path);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path << "\n";
            return 1;
        }
        config = asciicam::merge_config(config, *loaded);
    } else {
        if (auto loaded_default = asciicam::Config::load_default()) {
            config = asciicam::merge_config(config, *loaded_default);
        }
    }
    config = asciicam::apply_cli_overrides(config, args);

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    asciicam::KeyMap keys = asciicam::KeyMap::defaults();
    std::string keys_error;
    if (!keys.apply_overrides(config.keys, keys_error)) {
        std::cerr << "Error: Invalid config: " << keys_error << "\n";
        return 1;
    }

    const bool verbose = config.debug.verbose;
    if (verbose) {
        for (const auto& [key, cmd] : keys.bindings()) {
            std::cerr << "[input] " << asciicam::describe_key(key) << " -> "
                      << asciicam::command_name(cmd) << "\n";
        }
    }

    auto device = std::make_unique<asciicam::OpenCVCameraDevice>();
    asciicam::Result init = device->initialize();
    if (!init.success()) {
        std::cerr << "Error: Camera subsystem unavailable: " << init.message << "\n";
        return 2;
    }

    auto cameras = asciicam::list_cameras();
    if (cameras.empty()) {
        std::cerr << "Warning: No cameras detected, start will likely fail\n";
    } else {
        std::cerr << "[camera] Found " << cameras.size() << " camera(s), using index "
                  << config.camera.device_index << "\n";
    }

    auto clock = std::make_shared<asciicam::SteadyClock>();

    asciicam::CaptureConfig capture_cfg;
    capture_cfg.request.index = config.camera.device_index;
    capture_cfg.request.width = config.camera.width;
    capture_cfg.request.height = config.camera.height;
    capture_cfg.request.fps = config.camera.capture_fps;
    capture_cfg.frame_skip_threshold = std::chrono::milliseconds(config.camera.frame_skip_ms);
    capture_cfg.force_stop_retries = config.camera.force_stop_retries;
    capture_cfg.verbose = verbose;

    asciicam::EventQueue queue;
    auto source = std::make_unique<asciicam::CaptureSource>(std::move(device), clock, capture_cfg);
    source->set_sinks(
        [&queue](asciicam::Frame frame) { queue.push(asciicam::FrameEvent{std::move(frame)}); },
        [&queue](asciicam::DeviceAck ack) { queue.push(std::move(ack)); });
    asciicam::DeviceStateController controller(std::move(source), verbose);

    asciicam::Terminal terminal;
    const asciicam::ColorMode color_mode = args.color_mode.value_or(terminal.color_mode());
    asciicam::TerminalRenderer renderer(terminal, color_mode);
    if (!terminal.supports_utf8()) {
        std::cerr << "Warning: terminal may not support UTF-8, prefer --char-set dense or simple\n";
    }

    asciicam::RouterConfig router_cfg;
    router_cfg.tick_interval = config.tick_interval();
    router_cfg.render_interval = config.render_interval();
    router_cfg.verbose = verbose;
    router_cfg.idle_hint = asciicam::start_hint(keys);
    asciicam::EventRouter router(queue, controller, renderer, *clock, router_cfg, config.initial_settings());

    std::signal(SIGINT, handle_sigint);

    terminal.enter_alt_screen();
    terminal.hide_cursor();
    terminal.clear_screen();

    std::atomic<bool> input_running{true};
    std::thread input_thread([&queue, &keys, &input_running]() {
        asciicam::Keyboard keyboard;
        if (!keyboard.raw()) {
            std::cerr << "Warning: stdin is not a terminal, keys are read line by line\n";
        }
        while (input_running) {
            if (g_interrupted) {
                queue.push(asciicam::ControlCommand::Quit);
                break;
            }
            int key = keyboard.read_key(std::chrono::milliseconds(50));
            if (key < 0) continue;
            if (auto cmd = keys.lookup(key)) {
                queue.push(*cmd);
            }
        }
    });

    if (config.camera.autostart) {
        asciicam::Result started = controller.request_start();
        if (!started.success()) {
            std::cerr << "Warning: autostart rejected: " << started.message << "\n";
        }
    }

    auto session_start = std::chrono::steady_clock::now();
    router.run();
    auto session_end = std::chrono::steady_clock::now();

    input_running = false;
    input_thread.join();

    terminal.restore();

    controller.shutdown(std::chrono::milliseconds(config.camera.stop_timeout_ms));

    const auto& stats = router.stats();
    double wall_seconds = std::chrono::duration<double>(session_end - session_start).count();
    if (stats.conversions > 0 && wall_seconds > 0.0) {
        std::cerr << std::fixed << std::setprecision(2)
                  << "[PERF] frames=" << stats.conversions
                  << ", coalesced=" << stats.frames_coalesced
                  << ", discarded=" << stats.frames_discarded
                  << ", failed=" << stats.conversion_failures
                  << ", wall_s=" << wall_seconds
                  << ", effective_fps=" << static_cast<double>(stats.conversions) / wall_seconds
                  << "\n";
    } else {
        std::cerr << "[PERF] no frames processed.\n";
    }

    return 0;
}
