#include "terminal.hpp"
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace asciicam {

namespace {

// VGA-style values for the 16 system colors, in SGR order.
const uint8_t kSystemColors[16][3] = {
    {0, 0, 0}, {128, 0, 0}, {0, 128, 0}, {128, 128, 0},
    {0, 0, 128}, {128, 0, 128}, {0, 128, 128}, {192, 192, 192},
    {128, 128, 128}, {255, 0, 0}, {0, 255, 0}, {255, 255, 0},
    {0, 0, 255}, {255, 0, 255}, {0, 255, 255}, {255, 255, 255}
};

// Channel levels of the xterm 6x6x6 cube (indices 16..231).
const int kCubeLevels[6] = {0, 95, 135, 175, 215, 255};

int nearest_cube_level(int v) {
    int best = 0;
    for (int i = 1; i < 6; ++i) {
        if (std::abs(v - kCubeLevels[i]) < std::abs(v - kCubeLevels[best])) best = i;
    }
    return best;
}

int squared_distance(int r1, int g1, int b1, int r2, int g2, int b2) {
    return (r1 - r2) * (r1 - r2) + (g1 - g2) * (g1 - g2) + (b1 - b2) * (b1 - b2);
}

int env_int(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::atoi(v) : 0;
}

bool contains_utf8_tag(const char* value) {
    if (!value) return false;
    return std::strstr(value, "UTF-8") || std::strstr(value, "utf-8") ||
           std::strstr(value, "UTF8") || std::strstr(value, "utf8");
}

}

Terminal::Terminal() {
    info_ = query_info();
}

Terminal::~Terminal() {
    restore();
}

TerminalInfo Terminal::query_info() const {
    TerminalInfo info;
    info.cols = 0;
    info.rows = 0;

#ifdef _WIN32
    HANDLE out = GetStdHandle(STD_OUTPUT_HANDLE);
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (out != INVALID_HANDLE_VALUE && GetConsoleScreenBufferInfo(out, &csbi)) {
        info.cols = csbi.srWindow.Right - csbi.srWindow.Left + 1;
        info.rows = csbi.srWindow.Bottom - csbi.srWindow.Top + 1;
    }
#else
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0) {
        info.cols = ws.ws_col;
        info.rows = ws.ws_row;
    }
#endif

    // Not a terminal (redirected output): trust the shell, then fall back.
    if (info.cols <= 0) info.cols = env_int("COLUMNS");
    if (info.rows <= 0) info.rows = env_int("LINES");
    if (info.cols <= 0) info.cols = 80;
    if (info.rows <= 0) info.rows = 24;

    info.color_mode = detect_color_mode();
    info.supports_utf8 = detect_utf8();
    return info;
}

void Terminal::refresh() {
    info_ = query_info();
}

ColorMode Terminal::detect_color_mode() {
    const char* no_color = std::getenv("NO_COLOR");
    if (no_color && *no_color) return ColorMode::None;

    const char* term = std::getenv("TERM");
    const std::string t = term ? term : "";
    if (t == "dumb") return ColorMode::None;

    const char* colorterm = std::getenv("COLORTERM");
    if (colorterm && (std::strcmp(colorterm, "truecolor") == 0 || std::strcmp(colorterm, "24bit") == 0)) {
        return ColorMode::Truecolor;
    }
    if (t.find("256color") != std::string::npos) return ColorMode::Ansi256;
    return ColorMode::Ansi16;
}

bool Terminal::detect_utf8() {
#ifdef _WIN32
    return GetConsoleOutputCP() == CP_UTF8;
#else
    // First non-empty of LC_ALL, LC_CTYPE, LANG decides, as in setlocale().
    for (const char* name : {"LC_ALL", "LC_CTYPE", "LANG"}) {
        const char* v = std::getenv(name);
        if (v && *v) return contains_utf8_tag(v);
    }
    return false;
#endif
}

void Terminal::emit(const char* seq) {
    std::fputs(seq, stdout);
}

void Terminal::enter_alt_screen() {
    if (in_alt_screen_) return;
    emit("\033[?1049h");
    in_alt_screen_ = true;
    flush();
}

void Terminal::exit_alt_screen() {
    if (!in_alt_screen_) return;
    emit("\033[?1049l");
    in_alt_screen_ = false;
    flush();
}

void Terminal::hide_cursor() {
    if (cursor_hidden_) return;
    emit("\033[?25l");
    cursor_hidden_ = true;
    flush();
}

void Terminal::show_cursor() {
    if (!cursor_hidden_) return;
    emit("\033[?25h");
    cursor_hidden_ = false;
    flush();
}

void Terminal::clear_screen() {
    emit("\033[0m\033[2J\033[H");
    flush();
}

void Terminal::reset_colors() {
    if (!colored_) return;
    emit("\033[0m");
    colored_ = false;
}

void Terminal::restore() {
    reset_colors();
    show_cursor();
    exit_alt_screen();
    flush();
}

void Terminal::write(const std::string& s) {
    std::fwrite(s.data(), 1, s.size(), stdout);
    colored_ = true;
}

void Terminal::flush() {
    std::fflush(stdout);
}

std::string Terminal::color_code(ColorMode mode, const Color& c) {
    char buf[24];
    switch (mode) {
        case ColorMode::None:
            return {};
        case ColorMode::Ansi16: {
            const int idx = rgb_to_16(c.r, c.g, c.b);
            std::snprintf(buf, sizeof(buf), "\033[%dm", idx < 8 ? 30 + idx : 90 + idx - 8);
            break;
        }
        case ColorMode::Ansi256:
            std::snprintf(buf, sizeof(buf), "\033[38;5;%dm", rgb_to_256(c.r, c.g, c.b));
            break;
        case ColorMode::Truecolor:
            std::snprintf(buf, sizeof(buf), "\033[38;2;%d;%d;%dm", c.r, c.g, c.b);
            break;
    }
    return buf;
}

// Picks the closer of the nearest cube entry and the nearest gray ramp entry
// (indices 232..255, levels 8..238 in steps of 10).
uint8_t Terminal::rgb_to_256(uint8_t r, uint8_t g, uint8_t b) {
    const int ri = nearest_cube_level(r);
    const int gi = nearest_cube_level(g);
    const int bi = nearest_cube_level(b);
    const int cube_idx = 16 + 36 * ri + 6 * gi + bi;
    const int cube_dist = squared_distance(r, g, b, kCubeLevels[ri], kCubeLevels[gi], kCubeLevels[bi]);

    const int avg = (r + g + b) / 3;
    int step = (avg - 8 + 5) / 10;
    if (step < 0) step = 0;
    if (step > 23) step = 23;
    const int level = 8 + step * 10;
    const int gray_dist = squared_distance(r, g, b, level, level, level);

    return static_cast<uint8_t>(gray_dist < cube_dist ? 232 + step : cube_idx);
}

uint8_t Terminal::rgb_to_16(uint8_t r, uint8_t g, uint8_t b) {
    int best = 0;
    int best_dist = INT_MAX;
    for (int i = 0; i < 16; ++i) {
        const int dist = squared_distance(r, g, b, kSystemColors[i][0], kSystemColors[i][1], kSystemColors[i][2]);
        if (dist < best_dist) {
            best_dist = dist;
            best = i;
        }
    }
    return static_cast<uint8_t>(best);
}

}
