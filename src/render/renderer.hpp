#pragma once

#include "core/types.hpp"
#include <string>

namespace asciicam {

// Text shown under the picture: capture state, conversion rate, active
// settings and the latest status or error message.
struct StatusLine {
    std::string camera_state;
    double fps = 0.0;
    std::string char_set;
    bool color = false;
    float scale = 1.0f;
    std::string message;
    // Key help shown while there is no picture.
    std::string hint;

    bool operator==(const StatusLine& other) const {
        return camera_state == other.camera_state && fps == other.fps &&
               char_set == other.char_set && color == other.color &&
               scale == other.scale && message == other.message && hint == other.hint;
    }
    bool operator!=(const StatusLine& other) const { return !(*this == other); }
};

std::string format_status(const StatusLine& status);

// Cuts UTF-8 `text` to at most `cols` code points, one column each.
void truncate_to_width(std::string& text, int cols);

// Paints a glyph grid. Called only from the event router thread.
class Renderer {
public:
    virtual ~Renderer() = default;

    // Cells available for the picture, excluding the status row.
    virtual Size viewport() const = 0;

    virtual void render(const GlyphGrid& grid, const StatusLine& status) = 0;
};

}
