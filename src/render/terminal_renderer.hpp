#pragma once

#include "core/types.hpp"
#include "render/renderer.hpp"
#include "terminal/terminal.hpp"
#include <vector>
#include <string>
#include <cstdint>

namespace asciicam {

// Draws glyph grids with ANSI escapes. Only cells that differ from the
// previous frame are emitted, and neighbouring changed cells of the same
// color share one color escape. The bottom terminal row holds the status.
class TerminalRenderer : public Renderer {
public:
    TerminalRenderer(Terminal& term, ColorMode color_mode);

    Size viewport() const override;
    void render(const GlyphGrid& grid, const StatusLine& status) override;

    // Builds the escape stream for one frame and advances the diff state.
    const std::string& compose(const GlyphGrid& grid, const StatusLine& status);

    void set_screen_size(int cols, int rows);
    // Forces the next frame to be drawn in full.
    void invalidate();

private:
    Terminal& term_;
    ColorMode color_mode_;
    int cols_ = 0;
    int rows_ = 0;
    std::vector<GlyphCell> screen_;
    std::vector<GlyphCell> prev_screen_;
    bool full_redraw_ = true;
    std::string drawn_status_;
    std::string out_buffer_;

    enum class FgState { Unknown, Default, Colored };
    FgState fg_state_ = FgState::Unknown;
    Color fg_color_;

    int picture_rows() const { return rows_ > 1 ? rows_ - 1 : 0; }
    void fill_screen(const GlyphGrid& grid);
    void append_color(const GlyphCell& cell);
    void append_utf8(uint32_t cp);
    void append_cursor_move(int row, int col);
};

}
