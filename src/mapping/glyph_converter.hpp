#pragma once

#include "core/types.hpp"
#include "glyph/char_sets.hpp"

namespace asciicam {

// Maps a normalized luminance (0..255) onto the index range of a character set
// of the given length. Monotonic in luminance; always within [0, set_length).
int glyph_index(uint8_t luma, int set_length);

// Converts one frame into a rows x cols glyph grid.
//
// The frame is area-resampled to the target size, each resampled pixel is
// reduced to luminance and mapped onto the character set, and when color is
// enabled the resampled RGB value is attached to the cell. A zero-sized target
// produces an empty grid. A frame whose buffer does not match its declared
// geometry is rejected with INVALID_FORMAT and `out` is left untouched.
Result convert_frame(const Frame& frame,
                     int target_rows,
                     int target_cols,
                     const CharacterSet& char_set,
                     bool color_enabled,
                     GlyphGrid& out);

}
