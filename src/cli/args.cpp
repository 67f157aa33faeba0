#include "args.hpp"
#include "glyph/char_sets.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>

namespace asciicam {

std::optional<ColorMode> parse_color_mode(const std::string& s) {
    if (s == "none") return ColorMode::None;
    if (s == "16") return ColorMode::Ansi16;
    if (s == "256") return ColorMode::Ansi256;
    if (s == "truecolor") return ColorMode::Truecolor;
    return std::nullopt;
}

static int clamp_int(int val, int min_val, int max_val, int default_val) {
    if (val < min_val || val > max_val) return default_val;
    return val;
}

static double clamp_double(double val, double min_val, double max_val, double default_val) {
    if (val < min_val || val > max_val) return default_val;
    return val;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "--config") == 0) {
            if (has_value) {
                args.config_path = argv[++i];
                if (!validate_path(args.config_path)) {
                    args.config_path.clear();
                }
            }
        }
        else if (strcmp(arg, "-d") == 0 || strcmp(arg, "--device") == 0) {
            if (has_value) args.device = clamp_int(std::atoi(argv[++i]), 0, 63, -1);
        }
        else if (strcmp(arg, "--width") == 0) {
            if (has_value) args.width = clamp_int(std::atoi(argv[++i]), 16, 7680, 0);
        }
        else if (strcmp(arg, "--height") == 0) {
            if (has_value) args.height = clamp_int(std::atoi(argv[++i]), 16, 4320, 0);
        }
        else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--fps") == 0) {
            if (has_value) args.capture_fps = clamp_double(std::atof(argv[++i]), 1.0, 240.0, 0.0);
        }
        else if (strcmp(arg, "--frame-rate") == 0) {
            if (has_value) args.frame_rate = clamp_double(std::atof(argv[++i]), 1.0, 120.0, 0.0);
        }
        else if (strcmp(arg, "--tick-rate") == 0) {
            if (has_value) args.tick_rate = clamp_double(std::atof(argv[++i]), 0.5, 120.0, 0.0);
        }
        else if (strcmp(arg, "--char-set") == 0) {
            if (has_value) {
                std::string cs = argv[++i];
                if (CharSet::parse(cs)) {
                    args.char_set = cs;
                }
            }
        }
        else if (strcmp(arg, "--scale") == 0) {
            if (has_value) {
                args.scale = static_cast<float>(clamp_double(std::atof(argv[++i]), 0.1, 2.0, 0.0));
            }
        }
        else if (strcmp(arg, "--color-mode") == 0) {
            if (has_value) args.color_mode = parse_color_mode(argv[++i]);
        }
        else if (strcmp(arg, "--color") == 0) {
            args.color = true;
        }
        else if (strcmp(arg, "--autostart") == 0) {
            args.autostart = true;
        }
        else if (strcmp(arg, "--list-cameras") == 0) {
            args.list_cameras = true;
        }
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else {
            args.error = std::string("unknown argument: ") + arg;
            return args;
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS]\n\n", prog);
    printf("Shows a live camera feed as text in the terminal.\n\n");
    printf("OPTIONS:\n");
    printf("      --config <FILE>     Config file path (default: platform-specific)\n");
    printf("  -d, --device <N>        Camera index (default: 0, range: 0-63)\n");
    printf("      --width <N>         Requested capture width (default: 640)\n");
    printf("      --height <N>        Requested capture height (default: 480)\n");
    printf("  -f, --fps <N>           Requested capture FPS (default: 30, range: 1-240)\n");
    printf("      --frame-rate <N>    Maximum redraws per second (default: 30, range: 1-120)\n");
    printf("      --tick-rate <N>     Control ticks per second (default: 4, range: 0.5-120)\n");
    printf("      --char-set <NAME>   Character set: dense, simple, blocks, minimal\n");
    printf("      --scale <N>         Picture scale (default: 1.0, range: 0.1-2.0)\n");
    printf("      --color             Start with color output enabled\n");
    printf("      --color-mode <MODE> Terminal colors: none, 16, 256, truecolor (default: detect)\n");
    printf("      --autostart         Start the camera immediately\n");
    printf("      --list-cameras      List detected cameras and exit\n");
    printf("  -v, --verbose           Log state transitions and dropped frames to stderr\n");
    printf("  -h, --help              Show this help\n");
    printf("\nINTERACTIVE CONTROLS (defaults, rebind in [keys]):\n");
    printf("  SPACE                   Start/stop camera\n");
    printf("  c                       Toggle color\n");
    printf("  s / a                   Next / previous character set\n");
    printf("  +/= / -                 Increase / decrease scale\n");
    printf("  f                       Force stop camera\n");
    printf("  r                       Reset camera after a fault\n");
    printf("  q/Esc                   Quit\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   $XDG_CONFIG_HOME/asciicam/config.toml (~/.config/asciicam/config.toml)\n");
    printf("    macOS:   ~/Library/Application Support/asciicam/config.toml\n");
    printf("    Windows: %%APPDATA%%\\asciicam\\config.toml\n");
    printf("\nLogs go to stderr; redirect it while running, e.g. %s 2>asciicam.log\n", prog);
}

}
