#include "core/color_space.hpp"
#include <cmath>
#include <cctype>
#include <cstdio>
#include <algorithm>
#include <charconv>

namespace chroma {

const std::array<float, 256>& ColorSpace::decode_table() {
    static const std::array<float, 256> table = [] {
        std::array<float, 256> t{};
        for (int i = 0; i < 256; ++i) {
            t[i] = srgb_decode(static_cast<uint8_t>(i));
        }
        return t;
    }();
    return table;
}

void ColorSpace::init() {
    decode_table();
}

float ColorSpace::srgb_decode(uint8_t c) {
    float cv = c / 255.0f;
    if (cv <= 0.04045f) {
        return cv / 12.92f;
    }
    return std::pow((cv + 0.055f) / 1.055f, 2.4f);
}

float ColorSpace::srgb_to_linear(uint8_t srgb) {
    return decode_table()[srgb];
}

LinearColor ColorSpace::srgb_to_linear(const RGB& rgb) {
    RGB c = RGB::clamped(rgb.r, rgb.g, rgb.b);
    return {srgb_to_linear(static_cast<uint8_t>(c.r)),
            srgb_to_linear(static_cast<uint8_t>(c.g)),
            srgb_to_linear(static_cast<uint8_t>(c.b))};
}

std::string ColorSpace::rgb_to_hex(const RGB& rgb) {
    RGB c = RGB::clamped(rgb.r, rgb.g, rgb.b);
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", c.r, c.g, c.b);
    return buf;
}

Result ColorSpace::hex_to_rgb(const std::string& hex, RGB& out) {
    std::string digits = hex;
    if (!digits.empty() && digits[0] == '#') {
        digits.erase(0, 1);
    }
    if (digits.size() != 6) {
        return Result::fail(ErrorCode::INVALID_COLOR_FORMAT, "Invalid HEX color: " + hex);
    }
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return Result::fail(ErrorCode::INVALID_COLOR_FORMAT, "Invalid HEX color: " + hex);
        }
    }

    int channels[3] = {0, 0, 0};
    for (int i = 0; i < 3; ++i) {
        const char* first = digits.data() + i * 2;
        auto [ptr, ec] = std::from_chars(first, first + 2, channels[i], 16);
        if (ec != std::errc() || ptr != first + 2) {
            return Result::fail(ErrorCode::INVALID_COLOR_FORMAT, "Invalid HEX color: " + hex);
        }
    }

    out = {channels[0], channels[1], channels[2]};
    return Result::ok();
}

int ColorSpace::wrap_hue(int h) {
    h %= 360;
    if (h < 0) h += 360;
    return h;
}

HSL ColorSpace::rgb_to_hsl(const RGB& rgb) {
    RGB c = RGB::clamped(rgb.r, rgb.g, rgb.b);
    double r = c.r / 255.0;
    double g = c.g / 255.0;
    double b = c.b / 255.0;

    double max_val = std::max({r, g, b});
    double min_val = std::min({r, g, b});
    double h = 0.0;
    double s = 0.0;
    double l = (max_val + min_val) / 2.0;

    if (max_val != min_val) {
        double d = max_val - min_val;
        s = l > 0.5 ? d / (2.0 - max_val - min_val) : d / (max_val + min_val);

        if (max_val == r) {
            h = ((g - b) / d + (g < b ? 6.0 : 0.0)) / 6.0;
        } else if (max_val == g) {
            h = ((b - r) / d + 2.0) / 6.0;
        } else {
            h = ((r - g) / d + 4.0) / 6.0;
        }
    }

    return {wrap_hue(static_cast<int>(std::lround(h * 360.0))),
            static_cast<int>(std::lround(s * 100.0)),
            static_cast<int>(std::lround(l * 100.0))};
}

RGB ColorSpace::hsl_to_rgb(const HSL& hsl) {
    double h = wrap_hue(hsl.h) / 360.0;
    double s = std::clamp(hsl.s, 0, 100) / 100.0;
    double l = std::clamp(hsl.l, 0, 100) / 100.0;

    double r, g, b;

    if (s == 0.0) {
        r = g = b = l;
    } else {
        auto hue_to_rgb = [](double p, double q, double t) {
            if (t < 0.0) t += 1.0;
            if (t > 1.0) t -= 1.0;
            if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
            if (t < 1.0 / 2.0) return q;
            if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
            return p;
        };

        double q = l < 0.5 ? l * (1.0 + s) : l + s - l * s;
        double p = 2.0 * l - q;

        r = hue_to_rgb(p, q, h + 1.0 / 3.0);
        g = hue_to_rgb(p, q, h);
        b = hue_to_rgb(p, q, h - 1.0 / 3.0);
    }

    return RGB::clamped(static_cast<int>(std::lround(r * 255.0)),
                        static_cast<int>(std::lround(g * 255.0)),
                        static_cast<int>(std::lround(b * 255.0)));
}

float ColorSpace::lab_f(float t) {
    if (t > 0.008856f) {
        return std::cbrt(t);
    }
    return 7.787f * t + 16.0f / 116.0f;
}

Lab ColorSpace::to_lab(const RGB& rgb) {
    LinearColor linear = srgb_to_linear(rgb);
    float r = linear.r;
    float g = linear.g;
    float b = linear.b;

    float x = (r * 0.4124f + g * 0.3576f + b * 0.1805f) / 0.95047f;
    float y = (r * 0.2126f + g * 0.7152f + b * 0.0722f) / 1.0f;
    float z = (r * 0.0193f + g * 0.1192f + b * 0.9505f) / 1.08883f;

    float fx = lab_f(x);
    float fy = lab_f(y);
    float fz = lab_f(z);

    return {116.0f * fy - 16.0f, 500.0f * (fx - fy), 200.0f * (fy - fz)};
}

float ColorSpace::delta_e(const RGB& c1, const RGB& c2) {
    return Lab::distance(to_lab(c1), to_lab(c2));
}

float ColorSpace::relative_luminance(const RGB& rgb) {
    RGB c = RGB::clamped(rgb.r, rgb.g, rgb.b);
    auto channel = [](int v) {
        float cv = v / 255.0f;
        return cv <= 0.03928f ? cv / 12.92f : std::pow((cv + 0.055f) / 1.055f, 2.4f);
    };
    LinearColor linear(channel(c.r), channel(c.g), channel(c.b));
    return linear.luminance();
}

float ColorSpace::contrast_ratio(const RGB& c1, const RGB& c2) {
    float l1 = relative_luminance(c1);
    float l2 = relative_luminance(c2);

    float lighter = std::max(l1, l2);
    float darker = std::min(l1, l2);

    return (lighter + 0.05f) / (darker + 0.05f);
}

bool ColorSpace::is_light_color(const RGB& rgb) {
    float luminance = (0.299f * rgb.r + 0.587f * rgb.g + 0.114f * rgb.b) / 255.0f;
    return luminance > 0.5f;
}

RGB ColorSpace::text_color(const RGB& background) {
    return is_light_color(background) ? RGB(0, 0, 0) : RGB(255, 255, 255);
}

HSL ColorSpace::lighten(const HSL& hsl, int amount) {
    return {hsl.h, hsl.s, std::min(100, hsl.l + amount)};
}

HSL ColorSpace::darken(const HSL& hsl, int amount) {
    return {hsl.h, hsl.s, std::max(0, hsl.l - amount)};
}

HSL ColorSpace::saturate(const HSL& hsl, int amount) {
    return {hsl.h, std::min(100, hsl.s + amount), hsl.l};
}

HSL ColorSpace::desaturate(const HSL& hsl, int amount) {
    return {hsl.h, std::max(0, hsl.s - amount), hsl.l};
}

HSL ColorSpace::rotate_hue(const HSL& hsl, int degrees) {
    return {wrap_hue(hsl.h + degrees), hsl.s, hsl.l};
}

HSL ColorSpace::complementary(const HSL& hsl) {
    return rotate_hue(hsl, 180);
}

std::pair<HSL, HSL> ColorSpace::analogous(const HSL& hsl) {
    return {rotate_hue(hsl, 30), rotate_hue(hsl, 330)};
}

std::pair<HSL, HSL> ColorSpace::triadic(const HSL& hsl) {
    return {rotate_hue(hsl, 120), rotate_hue(hsl, 240)};
}

std::pair<HSL, HSL> ColorSpace::split_complementary(const HSL& hsl) {
    return {rotate_hue(hsl, 150), rotate_hue(hsl, 210)};
}

Color make_color(const RGB& rgb) {
    Color color;
    color.rgb = RGB::clamped(rgb.r, rgb.g, rgb.b);
    color.hex = ColorSpace::rgb_to_hex(color.rgb);
    color.hsl = ColorSpace::rgb_to_hsl(color.rgb);
    return color;
}

Color make_color(const RGB& rgb, const std::string& name) {
    Color color = make_color(rgb);
    color.name = name;
    return color;
}

Color make_color(const HSL& hsl) {
    Color color;
    color.hsl = {ColorSpace::wrap_hue(hsl.h), std::clamp(hsl.s, 0, 100), std::clamp(hsl.l, 0, 100)};
    color.rgb = ColorSpace::hsl_to_rgb(color.hsl);
    color.hex = ColorSpace::rgb_to_hex(color.rgb);
    return color;
}

Result make_color_from_hex(const std::string& hex, Color& out) {
    RGB rgb;
    Result r = ColorSpace::hex_to_rgb(hex, rgb);
    if (r.failure()) {
        return r;
    }
    out = make_color(rgb);
    return Result::ok();
}

Result make_color_from_hex(const std::string& hex, Color& out, const std::string& name) {
    Color color;
    Result r = make_color_from_hex(hex, color);
    if (r.failure()) {
        return r;
    }
    color.name = name;
    out = std::move(color);
    return Result::ok();
}

}
