#include "glyph_converter.hpp"

#include <algorithm>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#ifdef ASCIICAM_HAS_OPENMP
#include <omp.h>
#endif

namespace asciicam {

int glyph_index(uint8_t luma, int set_length) {
    if (set_length <= 1) return 0;
    const int idx = static_cast<int>(luma) * (set_length - 1) / 255;
    return std::clamp(idx, 0, set_length - 1);
}

Result convert_frame(const Frame& frame,
                     int target_rows,
                     int target_cols,
                     const CharacterSet& char_set,
                     bool color_enabled,
                     GlyphGrid& out) {
    if (target_rows <= 0 || target_cols <= 0) {
        out = GlyphGrid();
        return Result::ok();
    }
    if (char_set.glyphs.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "character set has no glyphs");
    }
    if (!frame.well_formed()) {
        return Result::fail(ErrorCode::INVALID_FORMAT,
            "frame buffer holds " + std::to_string(frame.byte_size()) + " bytes, expected " +
            std::to_string(frame.expected_byte_size()) + " for " +
            std::to_string(frame.width()) + "x" + std::to_string(frame.height()) + "x" +
            std::to_string(frame.channels()));
    }

    const int channels = frame.channels();
    const int mat_type = channels == 1 ? CV_8UC1 : CV_8UC3;
    cv::Mat input_mat(frame.height(), frame.width(), mat_type,
                      const_cast<uint8_t*>(frame.data()));

    // INTER_AREA averages every source pixel that falls under a target cell;
    // OpenCV clamps the border samples to the frame.
    cv::Mat scaled_mat;
    try {
        cv::resize(input_mat, scaled_mat, cv::Size(target_cols, target_rows), 0, 0, cv::INTER_AREA);
    } catch (const cv::Exception& e) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, std::string("resample failed: ") + e.what());
    }

    const std::vector<uint32_t>& glyphs = char_set.glyphs;
    const int set_length = static_cast<int>(glyphs.size());
    std::vector<GlyphCell> cells(static_cast<size_t>(target_rows) * target_cols);

#ifdef ASCIICAM_HAS_OPENMP
    #pragma omp parallel for
#endif
    for (int y = 0; y < target_rows; ++y) {
        const uint8_t* src = scaled_mat.ptr<uint8_t>(y);
        GlyphCell* dst = cells.data() + static_cast<size_t>(y) * target_cols;
        for (int x = 0; x < target_cols; ++x) {
            Color c;
            if (channels == 1) {
                c = Color(src[x], src[x], src[x]);
            } else {
                const int idx = x * 3;
                c = Color(src[idx], src[idx + 1], src[idx + 2]);
            }
            GlyphCell& cell = dst[x];
            cell.codepoint = glyphs[glyph_index(luminance(c), set_length)];
            cell.has_color = color_enabled;
            if (color_enabled) cell.color = c;
        }
    }

    out = GlyphGrid(target_rows, target_cols, std::move(cells));
    return Result::ok();
}

}
