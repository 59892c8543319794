#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <optional>
#include <string>

namespace chroma {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    INVALID_ARGUMENT,
    INVALID_COLOR_FORMAT,
    EMPTY_IMAGE,
    CONFIG_ERROR
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::FILE_NOT_FOUND: return "file_not_found";
        case ErrorCode::INVALID_FORMAT: return "invalid_format";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::INVALID_COLOR_FORMAT: return "invalid_color_format";
        case ErrorCode::EMPTY_IMAGE: return "empty_image";
        case ErrorCode::CONFIG_ERROR: return "config_error";
    }
    return "unknown";
}

struct RGB {
    int r = 0;
    int g = 0;
    int b = 0;

    constexpr RGB() = default;
    constexpr RGB(int r, int g, int b) : r(r), g(g), b(b) {}

    static RGB clamped(int r, int g, int b) {
        return {std::clamp(r, 0, 255), std::clamp(g, 0, 255), std::clamp(b, 0, 255)};
    }

    constexpr bool operator==(const RGB& o) const { return r == o.r && g == o.g && b == o.b; }
    constexpr bool operator!=(const RGB& o) const { return !(*this == o); }
};

// h in [0, 360), s and l in [0, 100].
struct HSL {
    int h = 0;
    int s = 0;
    int l = 0;

    constexpr HSL() = default;
    constexpr HSL(int h, int s, int l) : h(h), s(s), l(l) {}

    constexpr bool operator==(const HSL& o) const { return h == o.h && s == o.s && l == o.l; }
    constexpr bool operator!=(const HSL& o) const { return !(*this == o); }
};

// hex is always derived from rgb; build through make_color() rather than by hand.
struct Color {
    std::string hex = "#000000";
    RGB rgb;
    HSL hsl;
    std::optional<std::string> name;
    std::optional<float> percentage;
};

struct Pixel {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    Pixel() = default;
    Pixel(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) : r(r), g(g), b(b), a(a) {}

    RGB rgb() const { return {r, g, b}; }
};

class PixelBuffer {
public:
    PixelBuffer() = default;
    PixelBuffer(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4, 0) {}
    PixelBuffer(int w, int h, const Pixel& fill) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4) {
        this->fill(fill);
    }

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    size_t byte_size() const { return data_.size(); }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    Pixel get_pixel(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return Pixel();
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        return Pixel(data_[idx], data_[idx+1], data_[idx+2], data_[idx+3]);
    }

    void set_pixel(int x, int y, const Pixel& p) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        data_[idx] = p.r;
        data_[idx+1] = p.g;
        data_[idx+2] = p.b;
        data_[idx+3] = p.a;
    }

    void fill(const Pixel& p) {
        for (int y = 0; y < height_; ++y) {
            for (int x = 0; x < width_; ++x) {
                set_pixel(x, y, p);
            }
        }
    }

    static PixelBuffer from_rgba(const uint8_t* rgba, int w, int h) {
        PixelBuffer buf(w, h);
        std::copy(rgba, rgba + buf.data_.size(), buf.data_.begin());
        return buf;
    }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> data_;
};

}
