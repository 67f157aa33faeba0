#include "terminal_renderer.hpp"
#include <algorithm>
#include <charconv>
#include <system_error>

namespace asciicam {

TerminalRenderer::TerminalRenderer(Terminal& term, ColorMode color_mode)
    : term_(term), color_mode_(color_mode) {
    const Size size = term_.get_size();
    set_screen_size(size.width, size.height);
}

Size TerminalRenderer::viewport() const {
    const TerminalInfo info = term_.query_info();
    return {info.cols, std::max(0, info.rows - 1)};
}

void TerminalRenderer::set_screen_size(int cols, int rows) {
    cols_ = std::max(0, cols);
    rows_ = std::max(0, rows);
    const size_t cells = static_cast<size_t>(cols_) * picture_rows();
    screen_.assign(cells, GlyphCell{});
    prev_screen_.assign(cells, GlyphCell{});
    const size_t reserve_bytes = cells * 8;
    if (out_buffer_.capacity() < reserve_bytes) {
        out_buffer_.reserve(reserve_bytes);
    }
    invalidate();
}

void TerminalRenderer::invalidate() {
    full_redraw_ = true;
    drawn_status_.clear();
    fg_state_ = FgState::Unknown;
}

void TerminalRenderer::render(const GlyphGrid& grid, const StatusLine& status) {
    term_.refresh();
    const Size size = term_.get_size();
    if (size.width != cols_ || size.height != rows_) {
        set_screen_size(size.width, size.height);
    }

    const std::string& out = compose(grid, status);
    if (!out.empty()) {
        term_.write(out);
    }
    term_.flush();
}

void TerminalRenderer::fill_screen(const GlyphGrid& grid) {
    const int rows = picture_rows();
    std::fill(screen_.begin(), screen_.end(), GlyphCell{});
    const int copy_rows = std::min(rows, grid.rows());
    const int copy_cols = std::min(cols_, grid.cols());
    for (int y = 0; y < copy_rows; ++y) {
        const GlyphCell* src = grid.row(y);
        std::copy(src, src + copy_cols, screen_.begin() + static_cast<size_t>(y) * cols_);
    }
}

const std::string& TerminalRenderer::compose(const GlyphGrid& grid, const StatusLine& status) {
    out_buffer_.clear();
    fill_screen(grid);

    if (full_redraw_) {
        out_buffer_ += "\033[0m\033[2J";
        fg_state_ = FgState::Default;
    }

    int cursor_x = -1;
    int cursor_y = -1;
    const int rows = picture_rows();

    for (int y = 0; y < rows; ++y) {
        int x = 0;
        while (x < cols_) {
            const size_t idx = static_cast<size_t>(y) * cols_ + x;
            const GlyphCell& cell = screen_[idx];

            if (!full_redraw_ && cell == prev_screen_[idx]) {
                ++x;
                continue;
            }

            const int target_x = x + 1;
            const int target_y = y + 1;
            if (cursor_x != target_x || cursor_y != target_y) {
                append_cursor_move(target_y, target_x);
            }
            append_color(cell);

            // Extend over following changed cells drawn with the same color.
            int run_end = x;
            for (int rx = x + 1; rx < cols_; ++rx) {
                const size_t ridx = static_cast<size_t>(y) * cols_ + rx;
                const GlyphCell& rcell = screen_[ridx];
                if (!full_redraw_ && rcell == prev_screen_[ridx]) break;
                if (rcell.has_color != cell.has_color) break;
                if (cell.has_color && rcell.color != cell.color) break;
                run_end = rx;
            }

            for (int rx = x; rx <= run_end; ++rx) {
                append_utf8(screen_[static_cast<size_t>(y) * cols_ + rx].codepoint);
            }

            cursor_x = run_end + 2;
            cursor_y = target_y;
            x = run_end + 1;
        }
    }

    std::string status_text = format_status(status);
    truncate_to_width(status_text, cols_);
    if (rows_ > 0 && status_text != drawn_status_) {
        append_cursor_move(rows_, 1);
        out_buffer_ += "\033[0m\033[2K";
        fg_state_ = FgState::Default;
        out_buffer_ += status_text;
        drawn_status_ = status_text;
    }

    prev_screen_ = screen_;
    full_redraw_ = false;
    return out_buffer_;
}

void TerminalRenderer::append_color(const GlyphCell& cell) {
    if (color_mode_ == ColorMode::None) return;

    if (cell.has_color) {
        if (fg_state_ == FgState::Colored && fg_color_ == cell.color) return;
        out_buffer_ += Terminal::color_code(color_mode_, cell.color);
        fg_state_ = FgState::Colored;
        fg_color_ = cell.color;
        return;
    }

    if (fg_state_ != FgState::Default) {
        out_buffer_ += "\033[39m";
        fg_state_ = FgState::Default;
    }
}

void TerminalRenderer::append_cursor_move(int row, int col) {
    out_buffer_.push_back('\033');
    out_buffer_.push_back('[');

    char tmp[16];
    auto row_res = std::to_chars(tmp, tmp + sizeof(tmp), row);
    if (row_res.ec == std::errc()) {
        out_buffer_.append(tmp, row_res.ptr);
    } else {
        out_buffer_.push_back('1');
    }

    out_buffer_.push_back(';');

    auto col_res = std::to_chars(tmp, tmp + sizeof(tmp), col);
    if (col_res.ec == std::errc()) {
        out_buffer_.append(tmp, col_res.ptr);
    } else {
        out_buffer_.push_back('1');
    }

    out_buffer_.push_back('H');
}

void TerminalRenderer::append_utf8(uint32_t cp) {
    if (cp < 0x80) {
        out_buffer_.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out_buffer_.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out_buffer_.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out_buffer_.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out_buffer_.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out_buffer_.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out_buffer_.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out_buffer_.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out_buffer_.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out_buffer_.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

}
