#pragma once

#include "terminal/terminal.hpp"
#include <optional>
#include <string>

namespace asciicam {

// Zero, negative or empty means "not given on the command line".
struct Args {
    std::string config_path;
    std::string char_set;
    std::optional<ColorMode> color_mode;

    int device = -1;
    int width = 0;
    int height = 0;
    double capture_fps = 0.0;
    double frame_rate = 0.0;
    double tick_rate = 0.0;
    float scale = 0.0f;

    bool color = false;
    bool autostart = false;
    bool list_cameras = false;
    bool verbose = false;
    bool show_help = false;

    // Set when an argument could not be understood at all.
    std::string error;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);
std::optional<ColorMode> parse_color_mode(const std::string& s);

}
