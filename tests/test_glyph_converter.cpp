#include <iostream>
#include <cassert>
#include <vector>
#include <string>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/settings.hpp"
#include "../src/glyph/char_sets.hpp"
#include "../src/mapping/glyph_converter.hpp"

using namespace asciicam;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static const CharSetId kAllSets[] = {
    CharSetId::Dense, CharSetId::Simple, CharSetId::Blocks, CharSetId::Minimal
};

static bool all_cells_are(const GlyphGrid& grid, uint32_t cp) {
    for (const auto& cell : grid.cells()) {
        if (cell.codepoint != cp) return false;
    }
    return true;
}

TEST(white_frame_maps_to_brightest_glyph) {
    const CharacterSet& minimal = CharSet::get(CharSetId::Minimal);
    assert(minimal.size() == 5);

    Frame white(640, 480, Color(255, 255, 255));
    GlyphGrid grid;
    Result r = convert_frame(white, 24, 80, minimal, false, grid);
    assert(r.success());
    assert(grid.rows() == 24);
    assert(grid.cols() == 80);
    assert(all_cells_are(grid, minimal.glyphs[4]));
    assert(grid.at(0, 0).codepoint == 0x2588);
}

TEST(black_frame_maps_to_darkest_glyph) {
    const CharacterSet& minimal = CharSet::get(CharSetId::Minimal);
    Frame black(640, 480, Color(0, 0, 0));
    GlyphGrid grid;
    assert(convert_frame(black, 24, 80, minimal, false, grid).success());
    assert(all_cells_are(grid, minimal.glyphs[0]));
    assert(grid.at(23, 79).codepoint == ' ');
}

TEST(luma_weights_normalize_to_full_range) {
    assert(kLumaWeightSum == 256);
    assert(luminance(255, 255, 255) == 255);
    assert(luminance(0, 0, 0) == 0);
    assert(luminance(255, 0, 0) < luminance(0, 255, 0));
    assert(luminance(0, 0, 255) < luminance(255, 0, 0));
}

TEST(gradient_spans_every_glyph_index) {
    std::vector<uint8_t> ramp(256);
    for (int i = 0; i < 256; ++i) ramp[i] = static_cast<uint8_t>(i);
    Frame gradient(256, 1, 1, ramp);

    for (CharSetId id : kAllSets) {
        const CharacterSet& set = CharSet::get(id);
        GlyphGrid grid;
        assert(convert_frame(gradient, 1, 256, set, false, grid).success());
        assert(grid.at(0, 0).codepoint == set.glyphs.front());
        assert(grid.at(0, 255).codepoint == set.glyphs.back());

        // Every glyph of the set appears somewhere on the ramp.
        for (uint32_t glyph : set.glyphs) {
            bool seen = false;
            for (int x = 0; x < 256 && !seen; ++x) {
                seen = grid.at(0, x).codepoint == glyph;
            }
            assert(seen);
        }
    }
}

TEST(glyph_index_is_monotonic) {
    for (CharSetId id : kAllSets) {
        const int n = CharSet::get(id).size();
        int prev = 0;
        for (int l = 0; l <= 255; ++l) {
            const int idx = glyph_index(static_cast<uint8_t>(l), n);
            assert(idx >= prev);
            assert(idx >= 0 && idx < n);
            prev = idx;
        }
        assert(glyph_index(0, n) == 0);
        assert(glyph_index(255, n) == n - 1);
    }
    assert(glyph_index(200, 1) == 0);
}

TEST(zero_target_yields_empty_grid) {
    Frame white(32, 32, Color(255, 255, 255));
    GlyphGrid grid;
    Result r = convert_frame(white, 0, 80, CharSet::get(CharSetId::Dense), false, grid);
    assert(r.success());
    assert(grid.empty());

    r = convert_frame(white, 10, 0, CharSet::get(CharSetId::Dense), false, grid);
    assert(r.success());
    assert(grid.empty());
}

TEST(malformed_frame_is_rejected) {
    const CharacterSet& dense = CharSet::get(CharSetId::Dense);
    GlyphGrid grid;
    Frame good(8, 8, Color(255, 255, 255));
    assert(convert_frame(good, 2, 2, dense, false, grid).success());

    Frame short_buffer(10, 10, 3, std::vector<uint8_t>(17, 0));
    Result r = convert_frame(short_buffer, 2, 2, dense, false, grid);
    assert(r.error == ErrorCode::INVALID_FORMAT);
    assert(grid.rows() == 2 && grid.cols() == 2);
    assert(all_cells_are(grid, dense.glyphs.back()));

    Frame two_channel(4, 4, 2, std::vector<uint8_t>(32, 0));
    assert(convert_frame(two_channel, 2, 2, dense, false, grid).error == ErrorCode::INVALID_FORMAT);
}

TEST(color_attached_only_when_enabled) {
    Frame red(8, 8, Color(200, 10, 10));
    const CharacterSet& dense = CharSet::get(CharSetId::Dense);

    GlyphGrid colored;
    assert(convert_frame(red, 2, 2, dense, true, colored).success());
    for (const auto& cell : colored.cells()) {
        assert(cell.has_color);
        assert(cell.color == Color(200, 10, 10));
    }

    GlyphGrid plain;
    assert(convert_frame(red, 2, 2, dense, false, plain).success());
    for (const auto& cell : plain.cells()) {
        assert(!cell.has_color);
    }
}

TEST(grayscale_frame_supported) {
    Frame gray(4, 4, 1, std::vector<uint8_t>(16, 255));
    assert(gray.get_pixel(3, 3) == Color(255, 255, 255));
    assert(gray.get_pixel(4, 0) == Color());
    const CharacterSet& simple = CharSet::get(CharSetId::Simple);
    GlyphGrid grid;
    assert(convert_frame(gray, 2, 2, simple, true, grid).success());
    assert(all_cells_are(grid, simple.glyphs.back()));
    assert(grid.at(1, 1).color == Color(255, 255, 255));
}

TEST(upscaling_target_is_supported) {
    Frame tiny(2, 2, Color(0, 0, 0));
    GlyphGrid grid;
    assert(convert_frame(tiny, 24, 80, CharSet::get(CharSetId::Blocks), false, grid).success());
    assert(grid.rows() == 24 && grid.cols() == 80);
    assert(all_cells_are(grid, ' '));
}

TEST(glyph_grid_bounds) {
    GlyphGrid grid(2, 3, std::vector<GlyphCell>(6));
    assert(grid.row(1) != nullptr);
    assert(grid.row(2) == nullptr);

    bool threw = false;
    try {
        (void)grid.at(2, 0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        GlyphGrid bad(2, 2, std::vector<GlyphCell>(3));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

TEST(char_set_sizes_and_order) {
    assert(CharSet::get(CharSetId::Dense).size() == 12);
    assert(CharSet::get(CharSetId::Simple).size() == 7);
    assert(CharSet::get(CharSetId::Blocks).size() == 9);
    assert(CharSet::get(CharSetId::Minimal).size() == 5);

    assert(CharSet::next(CharSetId::Dense) == CharSetId::Simple);
    assert(CharSet::next(CharSetId::Minimal) == CharSetId::Dense);
    assert(CharSet::previous(CharSetId::Dense) == CharSetId::Minimal);
    for (CharSetId id : kAllSets) {
        assert(CharSet::previous(CharSet::next(id)) == id);
        assert(CharSet::get(id).glyphs.front() == ' ');
    }

    assert(CharSet::parse("blocks") == CharSetId::Blocks);
    assert(!CharSet::parse("line-art"));
}

TEST(utf8_decoding_rejects_invalid_sequences) {
    auto cps = CharSet::to_codepoints("a\xE2\x96\x88");
    assert(cps.size() == 2);
    assert(cps[1] == 0x2588);

    auto truncated = CharSet::to_codepoints("b\xE2\x96");
    assert(truncated.size() == 1);
    assert(truncated[0] == 'b');

    auto surrogate = CharSet::to_codepoints("\xED\xA0\x80");
    assert(surrogate.empty());
}

TEST(scale_steps_and_clamps) {
    Settings s;
    assert(s.scale == 1.0f);
    for (int i = 0; i < 20; ++i) s.increase_scale();
    assert(s.scale == kMaxScale);
    for (int i = 0; i < 30; ++i) s.decrease_scale();
    assert(s.scale == kMinScale);

    s.set_scale(1.0f);
    s.decrease_scale();
    s.decrease_scale();
    assert(s.scale > 0.79f && s.scale < 0.81f);
}

TEST(scaled_grid_size_rules) {
    Size full = scaled_grid_size({80, 24}, 1.0f);
    assert(full.width == 80 && full.height == 24);

    Size half = scaled_grid_size({80, 24}, 0.5f);
    assert(half.width == 40 && half.height == 12);

    Size tiny = scaled_grid_size({3, 3}, 0.1f);
    assert(tiny.width == 1 && tiny.height == 1);

    Size none = scaled_grid_size({0, 24}, 1.0f);
    assert(none.width == 0 && none.height == 0);
}

int main() {
    std::cout << "=== Glyph Converter Tests ===\n\n";

    std::cout << "--- Conversion ---\n";
    RUN_TEST(white_frame_maps_to_brightest_glyph);
    RUN_TEST(black_frame_maps_to_darkest_glyph);
    RUN_TEST(luma_weights_normalize_to_full_range);
    RUN_TEST(gradient_spans_every_glyph_index);
    RUN_TEST(glyph_index_is_monotonic);
    RUN_TEST(zero_target_yields_empty_grid);
    RUN_TEST(malformed_frame_is_rejected);
    RUN_TEST(color_attached_only_when_enabled);
    RUN_TEST(grayscale_frame_supported);
    RUN_TEST(upscaling_target_is_supported);
    RUN_TEST(glyph_grid_bounds);

    std::cout << "\n--- Character Sets ---\n";
    RUN_TEST(char_set_sizes_and_order);
    RUN_TEST(utf8_decoding_rejects_invalid_sequences);

    std::cout << "\n--- Settings ---\n";
    RUN_TEST(scale_steps_and_clamps);
    RUN_TEST(scaled_grid_size_rules);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\n✓ All tests passed!\n";
        return 0;
    } else {
        std::cout << "\n✗ Some tests failed!\n";
        return 1;
    }
}
