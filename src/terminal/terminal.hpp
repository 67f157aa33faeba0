#pragma once

#include "core/types.hpp"
#include <string>

namespace asciicam {

enum class ColorMode {
    None,
    Ansi16,
    Ansi256,
    Truecolor
};

struct TerminalInfo {
    int cols = 80;
    int rows = 24;
    ColorMode color_mode = ColorMode::Ansi16;
    bool supports_utf8 = true;
};

// The controlling terminal on stdout. Screen modes switched on through this
// object are switched back off by restore() or on destruction.
class Terminal {
public:
    Terminal();
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    TerminalInfo query_info() const;
    // Re-reads the window size; call after a resize.
    void refresh();
    Size get_size() const { return {info_.cols, info_.rows}; }
    ColorMode color_mode() const { return info_.color_mode; }
    bool supports_utf8() const { return info_.supports_utf8; }

    // COLORTERM and TERM based; NO_COLOR or TERM=dumb disable color.
    static ColorMode detect_color_mode();
    static bool detect_utf8();

    void enter_alt_screen();
    void exit_alt_screen();
    void hide_cursor();
    void show_cursor();
    void clear_screen();
    void reset_colors();
    void restore();

    void write(const std::string& s);
    void flush();

    // Foreground escape for `c` in `mode`; empty when the mode has no color.
    static std::string color_code(ColorMode mode, const Color& c);
    static uint8_t rgb_to_256(uint8_t r, uint8_t g, uint8_t b);
    static uint8_t rgb_to_16(uint8_t r, uint8_t g, uint8_t b);

private:
    TerminalInfo info_;
    bool in_alt_screen_ = false;
    bool cursor_hidden_ = false;
    bool colored_ = false;

    void emit(const char* seq);
};

}
