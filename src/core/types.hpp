#pragma once

#include <vector>
#include <cstdint>
#include <cmath>
#include <algorithm>
#include <cstring>
#include <string>

namespace forge {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_INPUT,
    PARSE_ERROR,
    IO_ERROR,
    FONT_ERROR,
    MISSING_CAPABILITY
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

const char* error_code_name(ErrorCode code);

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    int64_t area() const { return static_cast<int64_t>(width) * height; }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) : r(r), g(g), b(b), a(a) {}

    Color with_alpha(uint8_t alpha) const { return Color(r, g, b, alpha); }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

class FrameBuffer {
public:
    FrameBuffer() = default;
    FrameBuffer(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4, 0) {}
    FrameBuffer(int w, int h, const Color& fill) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4) {
        this->fill(fill);
    }

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    Color get_pixel(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return Color();
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        return Color(data_[idx], data_[idx+1], data_[idx+2], data_[idx+3]);
    }

    void set_pixel(int x, int y, const Color& c) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        data_[idx] = c.r;
        data_[idx+1] = c.g;
        data_[idx+2] = c.b;
        data_[idx+3] = c.a;
    }

    // Source-over composite of c at coverage * c.a / 255. Destination stays opaque.
    void blend_pixel(int x, int y, const Color& c, float coverage = 1.0f) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        float a = (c.a / 255.0f) * std::clamp(coverage, 0.0f, 1.0f);
        if (a <= 0.0f) return;
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        data_[idx]   = static_cast<uint8_t>(std::lround(data_[idx]   * (1.0f - a) + c.r * a));
        data_[idx+1] = static_cast<uint8_t>(std::lround(data_[idx+1] * (1.0f - a) + c.g * a));
        data_[idx+2] = static_cast<uint8_t>(std::lround(data_[idx+2] * (1.0f - a) + c.b * a));
        data_[idx+3] = 255;
    }

    void fill(const Color& c) {
        for (size_t i = 0; i + 3 < data_.size(); i += 4) {
            data_[i] = c.r;
            data_[i+1] = c.g;
            data_[i+2] = c.b;
            data_[i+3] = c.a;
        }
    }

    void clear() {
        std::fill(data_.begin(), data_.end(), 0);
    }

    bool operator==(const FrameBuffer& other) const {
        return width_ == other.width_ && height_ == other.height_ && data_ == other.data_;
    }
    bool operator!=(const FrameBuffer& other) const { return !(*this == other); }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> data_;
};

// 8-bit coverage bitmap of a rendered text run. (origin_x, origin_y) is the
// pen origin on the ascender line; the ink box is relative to that origin.
struct CoverageMask {
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    int origin_x = 0;
    int origin_y = 0;
    int ink_x0 = 0;
    int ink_y0 = 0;
    int ink_x1 = 0;
    int ink_y1 = 0;

    bool empty() const { return pixels.empty(); }
    int ink_width() const { return ink_x1 - ink_x0; }
    int ink_height() const { return ink_y1 - ink_y0; }

    uint8_t at(int x, int y) const {
        if (x < 0 || x >= width || y < 0 || y >= height) return 0;
        return pixels[static_cast<size_t>(y) * width + x];
    }
};

}
