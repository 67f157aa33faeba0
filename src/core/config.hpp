#pragma once

#include "core/types.hpp"
#include "core/settings.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace asciicam {

constexpr int CONFIG_VERSION = 1;

struct ConfigCamera {
    int device_index = 0;
    int width = 640;
    int height = 480;
    double capture_fps = 30.0;
    int frame_skip_ms = 33;
    bool autostart = false;
    int force_stop_retries = 3;
    int stop_timeout_ms = 1000;
};

struct ConfigLoop {
    double tick_rate = 4.0;
    double frame_rate = 30.0;
};

struct ConfigAscii {
    std::string char_set = "dense";
    float scale = 1.0f;
    bool color = false;
};

struct ConfigDebug {
    bool verbose = false;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigCamera camera;
    ConfigLoop loop;
    ConfigAscii ascii;
    // Command name -> one-character key.
    std::map<std::string, std::string> keys;
    ConfigDebug debug;

    std::string config_path;

    bool validate(std::string& error) const;

    Settings initial_settings() const;
    std::chrono::nanoseconds tick_interval() const;
    std::chrono::nanoseconds render_interval() const;

    static Config defaults();
    static std::optional<Config> load(const std::string& path);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config merge_config(Config base, const Config& override);
Config apply_cli_overrides(Config config, const struct Args& args);

}
