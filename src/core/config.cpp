#include "core/config.hpp"
#include "cli/args.hpp"
#include "core/event.hpp"
#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>

#ifdef _WIN32
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace asciicam {

namespace {

std::string get_home_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_PROFILE, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return ".";
#else
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
#endif
}

std::string get_app_data_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_APPDATA, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* appdata = std::getenv("APPDATA");
    if (appdata) return std::string(appdata);
    return get_home_dir();
#elif defined(__APPLE__)
    return get_home_dir() + "/Library/Application Support";
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
#endif
}

std::chrono::nanoseconds rate_to_interval(double per_second) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double>(1.0 / per_second));
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/asciicam";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (version != CONFIG_VERSION) {
        error = "config_version must be " + std::to_string(CONFIG_VERSION);
        return false;
    }
    if (camera.device_index < 0 || camera.device_index > 63) {
        error = "camera.device_index must be between 0 and 63";
        return false;
    }
    if (camera.width < 16 || camera.width > 7680) {
        error = "camera.width must be between 16 and 7680";
        return false;
    }
    if (camera.height < 16 || camera.height > 4320) {
        error = "camera.height must be between 16 and 4320";
        return false;
    }
    if (camera.capture_fps < 1.0 || camera.capture_fps > 240.0) {
        error = "camera.capture_fps must be between 1 and 240";
        return false;
    }
    if (camera.frame_skip_ms < 0 || camera.frame_skip_ms > 1000) {
        error = "camera.frame_skip_ms must be between 0 and 1000";
        return false;
    }
    if (camera.force_stop_retries < 1 || camera.force_stop_retries > 10) {
        error = "camera.force_stop_retries must be between 1 and 10";
        return false;
    }
    if (camera.stop_timeout_ms < 50 || camera.stop_timeout_ms > 30000) {
        error = "camera.stop_timeout_ms must be between 50 and 30000";
        return false;
    }
    if (loop.tick_rate < 0.5 || loop.tick_rate > 120.0) {
        error = "loop.tick_rate must be between 0.5 and 120";
        return false;
    }
    if (loop.frame_rate < 1.0 || loop.frame_rate > 120.0) {
        error = "loop.frame_rate must be between 1 and 120";
        return false;
    }
    if (!CharSet::parse(ascii.char_set)) {
        error = "ascii.char_set must be one of dense, simple, blocks, minimal";
        return false;
    }
    if (ascii.scale < kMinScale || ascii.scale > kMaxScale) {
        error = "ascii.scale must be between 0.1 and 2.0";
        return false;
    }
    for (const auto& [name, key] : keys) {
        if (!parse_command_name(name)) {
            error = "keys." + name + " is not a known command";
            return false;
        }
        if (key.size() != 1) {
            error = "keys." + name + " must be a single character";
            return false;
        }
    }
    return true;
}

Settings Config::initial_settings() const {
    Settings settings;
    settings.char_set = CharSet::parse(ascii.char_set).value_or(CharSetId::Dense);
    settings.set_scale(ascii.scale);
    settings.color_enabled = ascii.color;
    return settings;
}

std::chrono::nanoseconds Config::tick_interval() const {
    return rate_to_interval(loop.tick_rate);
}

std::chrono::nanoseconds Config::render_interval() const {
    return rate_to_interval(loop.frame_rate);
}

std::optional<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            cfg.version = *v;
        }

        if (auto camera = tbl["camera"]) {
            if (auto v = camera["device_index"].value<int>()) cfg.camera.device_index = *v;
            if (auto v = camera["width"].value<int>()) cfg.camera.width = *v;
            if (auto v = camera["height"].value<int>()) cfg.camera.height = *v;
            if (auto v = camera["capture_fps"].value<double>()) cfg.camera.capture_fps = *v;
            if (auto v = camera["frame_skip_ms"].value<int>()) cfg.camera.frame_skip_ms = *v;
            if (auto v = camera["autostart"].value<bool>()) cfg.camera.autostart = *v;
            if (auto v = camera["force_stop_retries"].value<int>()) cfg.camera.force_stop_retries = *v;
            if (auto v = camera["stop_timeout_ms"].value<int>()) cfg.camera.stop_timeout_ms = *v;
        }
        if (auto loop = tbl["loop"]) {
            if (auto v = loop["tick_rate"].value<double>()) cfg.loop.tick_rate = *v;
            if (auto v = loop["frame_rate"].value<double>()) cfg.loop.frame_rate = *v;
        }
        if (auto ascii = tbl["ascii"]) {
            if (auto v = ascii["char_set"].value<std::string>()) cfg.ascii.char_set = *v;
            if (auto v = ascii["scale"].value<double>()) cfg.ascii.scale = static_cast<float>(*v);
            if (auto v = ascii["color"].value<bool>()) cfg.ascii.color = *v;
        }
        if (auto keys = tbl["keys"].as_table()) {
            for (const auto& [name, node] : *keys) {
                if (auto v = node.value<std::string>()) {
                    cfg.keys[std::string(name.str())] = *v;
                } else {
                    std::cerr << "Warning: ignoring non-string key binding '" << name.str() << "'\n";
                }
            }
        }
        if (auto debug = tbl["debug"]) {
            if (auto v = debug["verbose"].value<bool>()) cfg.debug.verbose = *v;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        std::cerr << "Error: " << path << ": " << e.description() << " (line "
                  << e.source().begin.line << ")\n";
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    std::string path = default_config_path();
    return load(path);
}

Config merge_config(Config base, const Config& override) {
    Config result = base;
    const Config def = Config::defaults();

    result.version = override.version;

    if (override.camera.device_index != def.camera.device_index)
        result.camera.device_index = override.camera.device_index;
    if (override.camera.width != def.camera.width) result.camera.width = override.camera.width;
    if (override.camera.height != def.camera.height) result.camera.height = override.camera.height;
    if (override.camera.capture_fps != def.camera.capture_fps)
        result.camera.capture_fps = override.camera.capture_fps;
    if (override.camera.frame_skip_ms != def.camera.frame_skip_ms)
        result.camera.frame_skip_ms = override.camera.frame_skip_ms;
    if (override.camera.autostart != def.camera.autostart)
        result.camera.autostart = override.camera.autostart;
    if (override.camera.force_stop_retries != def.camera.force_stop_retries)
        result.camera.force_stop_retries = override.camera.force_stop_retries;
    if (override.camera.stop_timeout_ms != def.camera.stop_timeout_ms)
        result.camera.stop_timeout_ms = override.camera.stop_timeout_ms;

    if (override.loop.tick_rate != def.loop.tick_rate) result.loop.tick_rate = override.loop.tick_rate;
    if (override.loop.frame_rate != def.loop.frame_rate) result.loop.frame_rate = override.loop.frame_rate;

    if (override.ascii.char_set != def.ascii.char_set) result.ascii.char_set = override.ascii.char_set;
    if (override.ascii.scale != def.ascii.scale) result.ascii.scale = override.ascii.scale;
    if (override.ascii.color != def.ascii.color) result.ascii.color = override.ascii.color;

    for (const auto& [name, key] : override.keys) {
        result.keys[name] = key;
    }

    if (override.debug.verbose) result.debug.verbose = true;
    if (!override.config_path.empty()) result.config_path = override.config_path;

    return result;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (args.device >= 0) config.camera.device_index = args.device;
    if (args.width > 0) config.camera.width = args.width;
    if (args.height > 0) config.camera.height = args.height;
    if (args.capture_fps > 0.0) config.camera.capture_fps = args.capture_fps;
    if (args.frame_rate > 0.0) config.loop.frame_rate = args.frame_rate;
    if (args.tick_rate > 0.0) config.loop.tick_rate = args.tick_rate;
    if (!args.char_set.empty()) config.ascii.char_set = args.char_set;
    if (args.scale > 0.0f) config.ascii.scale = args.scale;
    if (args.color) config.ascii.color = true;
    if (args.autostart) config.camera.autostart = true;
    if (args.verbose) config.debug.verbose = true;
    if (!args.config_path.empty()) config.config_path = args.config_path;
    return config;
}

}
