#pragma once

#include "core/types.hpp"
#include "glyph/char_sets.hpp"
#include <algorithm>
#include <cmath>

namespace asciicam {

constexpr float kMinScale = 0.1f;
constexpr float kMaxScale = 2.0f;
constexpr float kScaleStep = 0.1f;

// Conversion parameters. Written only by the event router in response to
// commands; the converter receives a copy per frame.
struct Settings {
    CharSetId char_set = CharSetId::Dense;
    float scale = 1.0f;
    bool color_enabled = false;

    void set_scale(float s) {
        // Keep one decimal so repeated steps land exactly on 0.1 multiples.
        s = std::round(s * 10.0f) / 10.0f;
        scale = std::clamp(s, kMinScale, kMaxScale);
    }
    void increase_scale() { set_scale(scale + kScaleStep); }
    void decrease_scale() { set_scale(scale - kScaleStep); }
    void next_char_set() { char_set = CharSet::next(char_set); }
    void previous_char_set() { char_set = CharSet::previous(char_set); }
    void toggle_color() { color_enabled = !color_enabled; }

    bool operator==(const Settings& other) const {
        return char_set == other.char_set && scale == other.scale &&
               color_enabled == other.color_enabled;
    }
    bool operator!=(const Settings& other) const { return !(*this == other); }
};

inline Size scaled_grid_size(Size viewport, float scale) {
    if (viewport.empty()) return {0, 0};
    const int w = static_cast<int>(static_cast<float>(viewport.width) * scale);
    const int h = static_cast<int>(static_cast<float>(viewport.height) * scale);
    return {std::max(1, w), std::max(1, h)};
}

}
