#pragma once

#include "core/types.hpp"
#include <array>
#include <cstdint>
#include <cmath>
#include <string>
#include <utility>

namespace chroma {

struct LinearColor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    LinearColor() = default;
    LinearColor(float r, float g, float b) : r(r), g(g), b(b) {}

    float luminance() const {
        return 0.2126f * r + 0.7152f * g + 0.0722f * b;
    }
};

struct Lab {
    float L = 0.0f;
    float a = 0.0f;
    float b = 0.0f;

    Lab() = default;
    Lab(float L, float a, float b) : L(L), a(a), b(b) {}

    static float distance(const Lab& c1, const Lab& c2) {
        float dL = c1.L - c2.L;
        float da = c1.a - c2.a;
        float db = c1.b - c2.b;
        return std::sqrt(dL * dL + da * da + db * db);
    }
};

class ColorSpace {
public:
    // Builds the sRGB decode table up front. Optional: the table is built on
    // first use otherwise. Safe to call from any thread.
    static void init();

    static std::string rgb_to_hex(const RGB& rgb);
    static Result hex_to_rgb(const std::string& hex, RGB& out);

    static HSL rgb_to_hsl(const RGB& rgb);
    static RGB hsl_to_rgb(const HSL& hsl);

    static float srgb_to_linear(uint8_t srgb);
    static LinearColor srgb_to_linear(const RGB& rgb);

    static Lab to_lab(const RGB& rgb);

    // CIE76 over the approximate Lab transform. Symmetric, 0 for equal inputs.
    static float delta_e(const RGB& c1, const RGB& c2);

    // WCAG 2.0 relative luminance and contrast ratio in [1, 21].
    static float relative_luminance(const RGB& rgb);
    static float contrast_ratio(const RGB& c1, const RGB& c2);

    static bool is_light_color(const RGB& rgb);
    static RGB text_color(const RGB& background);

    static HSL lighten(const HSL& hsl, int amount);
    static HSL darken(const HSL& hsl, int amount);
    static HSL saturate(const HSL& hsl, int amount);
    static HSL desaturate(const HSL& hsl, int amount);

    static HSL rotate_hue(const HSL& hsl, int degrees);
    static HSL complementary(const HSL& hsl);
    static std::pair<HSL, HSL> analogous(const HSL& hsl);
    static std::pair<HSL, HSL> triadic(const HSL& hsl);
    static std::pair<HSL, HSL> split_complementary(const HSL& hsl);

    static int wrap_hue(int h);

private:
    static const std::array<float, 256>& decode_table();
    static float srgb_decode(uint8_t c);
    static float lab_f(float t);
};

Color make_color(const RGB& rgb);
Color make_color(const RGB& rgb, const std::string& name);
Color make_color(const HSL& hsl);
// Fails like ColorSpace::hex_to_rgb; `out` is untouched on failure.
Result make_color_from_hex(const std::string& hex, Color& out);
Result make_color_from_hex(const std::string& hex, Color& out, const std::string& name);

}
