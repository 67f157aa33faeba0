#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace asciicam {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_FORMAT,
    PROCESSING_ERROR,
    INVALID_ARGUMENT,
    INVALID_STATE,
    DEVICE_ERROR,
    DEVICE_UNAVAILABLE,
    DEVICE_NOT_RUNNING,
    DEVICE_FAULT,
    TIMEOUT
};

const char* error_code_name(ErrorCode code);

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    bool empty() const { return width <= 0 || height <= 0; }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// Integer luma weights approximating 0.30R + 0.59G + 0.11B. The divisor is the
// sum of the weights so that pure white normalizes to exactly 255.
constexpr uint32_t kLumaWeightR = 77;
constexpr uint32_t kLumaWeightG = 150;
constexpr uint32_t kLumaWeightB = 29;
constexpr uint32_t kLumaWeightSum = kLumaWeightR + kLumaWeightG + kLumaWeightB;

inline uint8_t luminance(uint8_t r, uint8_t g, uint8_t b) {
    const uint32_t weighted = kLumaWeightR * r + kLumaWeightG * g + kLumaWeightB * b;
    return static_cast<uint8_t>(weighted / kLumaWeightSum);
}

inline uint8_t luminance(const Color& c) {
    return luminance(c.r, c.g, c.b);
}

// One captured raster image. Samples are interleaved RGB (3 channels) or
// grayscale (1 channel), rows packed without padding. Move-only: a frame has
// exactly one owner on its way from the capture thread to the converter.
class Frame {
public:
    Frame() = default;
    Frame(int w, int h, int channels)
        : width_(w), height_(h), channels_(channels),
          data_(static_cast<size_t>(std::max(0, w)) * std::max(0, h) * std::max(0, channels), 0) {}
    Frame(int w, int h, const Color& fill) : Frame(w, h, 3) {
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                set_pixel(x, y, fill);
            }
        }
    }
    Frame(int w, int h, int channels, std::vector<uint8_t> data)
        : width_(w), height_(h), channels_(channels), data_(std::move(data)) {}

    Frame(const Frame&) = delete;
    Frame& operator=(const Frame&) = delete;
    Frame(Frame&&) noexcept = default;
    Frame& operator=(Frame&&) noexcept = default;

    int width() const { return width_; }
    int height() const { return height_; }
    int channels() const { return channels_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ <= 0 || height_ <= 0 || data_.empty(); }
    size_t byte_size() const { return data_.size(); }
    size_t expected_byte_size() const {
        if (width_ <= 0 || height_ <= 0 || channels_ <= 0) return 0;
        return static_cast<size_t>(width_) * height_ * channels_;
    }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    // Sample count matches the declared geometry and the layout is one we can read.
    bool well_formed() const {
        return (channels_ == 1 || channels_ == 3) &&
               width_ > 0 && height_ > 0 &&
               data_.size() == expected_byte_size();
    }

    Color get_pixel(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_ || !well_formed()) return Color();
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * channels_;
        if (channels_ == 1) return Color(data_[idx], data_[idx], data_[idx]);
        return Color(data_[idx], data_[idx + 1], data_[idx + 2]);
    }

    void set_pixel(int x, int y, const Color& c) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_ || !well_formed()) return;
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * channels_;
        if (channels_ == 1) {
            data_[idx] = luminance(c);
            return;
        }
        data_[idx] = c.r;
        data_[idx + 1] = c.g;
        data_[idx + 2] = c.b;
    }

private:
    int width_ = 0;
    int height_ = 0;
    int channels_ = 3;
    std::vector<uint8_t> data_;
};

struct GlyphCell {
    uint32_t codepoint = ' ';
    bool has_color = false;
    Color color;

    bool operator==(const GlyphCell& other) const {
        return codepoint == other.codepoint && has_color == other.has_color &&
               (!has_color || color == other.color);
    }
    bool operator!=(const GlyphCell& other) const { return !(*this == other); }
};

// Converted text representation of one frame. Rows are stored back to back.
// A grid is never edited after construction; a new frame produces a new grid.
class GlyphGrid {
public:
    GlyphGrid() = default;
    GlyphGrid(int rows, int cols, std::vector<GlyphCell> cells)
        : rows_(rows), cols_(cols), cells_(std::move(cells)) {
        if (rows_ < 0 || cols_ < 0 ||
            cells_.size() != static_cast<size_t>(rows_) * static_cast<size_t>(cols_)) {
            throw std::invalid_argument("GlyphGrid cell count does not match dimensions");
        }
    }

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    bool empty() const { return rows_ == 0 || cols_ == 0; }
    const std::vector<GlyphCell>& cells() const { return cells_; }

    const GlyphCell& at(int row, int col) const {
        if (row < 0 || row >= rows_ || col < 0 || col >= cols_) {
            throw std::out_of_range("GlyphGrid::at index out of range");
        }
        return cells_[static_cast<size_t>(row) * cols_ + col];
    }

    const GlyphCell* row(int r) const {
        if (r < 0 || r >= rows_) return nullptr;
        return cells_.data() + static_cast<size_t>(r) * cols_;
    }

private:
    int rows_ = 0;
    int cols_ = 0;
    std::vector<GlyphCell> cells_;
};

}
