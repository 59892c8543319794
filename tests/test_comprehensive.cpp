#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>
#include <string>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/color_space.hpp"
#include "../src/naming/color_namer.hpp"
#include "../src/advise/harmony.hpp"
#include "../src/advise/palette_advisor.hpp"
#include "../src/advise/gradient.hpp"
#include "../src/advise/similarity.hpp"
#include "../src/terminal/terminal.hpp"

using namespace chroma;

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

static Color hex_color(const std::string& hex) {
    Color c;
    Result r = make_color_from_hex(hex, c);
    if (r.failure()) throw std::runtime_error(r.message);
    return c;
}

TEST(color_types_are_literal) {
    static constexpr RGB red(255, 0, 0);
    static_assert(red.r == 255 && red.g == 0 && red.b == 0);
    static_assert(RGB(1, 2, 3) == RGB(1, 2, 3));
    static_assert(HSL(10, 20, 30) != HSL(10, 20, 31));
    assert(named_colors().size() == kNamedColorCount);
    assert(named_colors()[0].rgb == red);
}

TEST(hex_encode) {
    assert(ColorSpace::rgb_to_hex({255, 87, 51}) == "#FF5733");
    assert(ColorSpace::rgb_to_hex({0, 0, 0}) == "#000000");
    assert(ColorSpace::rgb_to_hex({300, -5, 16}) == "#FF0010");
}

TEST(hex_decode) {
    RGB rgb;
    assert(ColorSpace::hex_to_rgb("#ff5733", rgb).success());
    assert(rgb == RGB(255, 87, 51));

    assert(ColorSpace::hex_to_rgb("00AAff", rgb).success());
    assert(rgb == RGB(0, 170, 255));
}

TEST(hex_decode_rejects_malformed) {
    const char* bad[] = {"#GG0000", "#FFF", "", "#", "12345", "#1234567", "#12 456"};
    for (const char* input : bad) {
        RGB rgb(1, 2, 3);
        Result r = ColorSpace::hex_to_rgb(input, rgb);
        assert(r.failure());
        assert(r.error == ErrorCode::INVALID_COLOR_FORMAT);
        assert(r.message.find(input) != std::string::npos);
        assert(rgb == RGB(1, 2, 3) && "Output must be untouched on failure");
    }
}

TEST(make_color_from_hex_normalizes) {
    Color c;
    assert(make_color_from_hex("abcdef", c, "Sample").success());
    assert(c.hex == "#ABCDEF");
    assert(c.name && *c.name == "Sample");

    Color untouched = make_color(RGB(1, 2, 3));
    assert(make_color_from_hex("nope", untouched).failure());
    assert(untouched.hex == "#010203");
}

TEST(hsl_known_values) {
    assert(ColorSpace::rgb_to_hsl({255, 0, 0}) == HSL(0, 100, 50));
    assert(ColorSpace::rgb_to_hsl({0, 255, 0}) == HSL(120, 100, 50));
    assert(ColorSpace::rgb_to_hsl({0, 0, 255}) == HSL(240, 100, 50));
    assert(ColorSpace::rgb_to_hsl({255, 255, 255}) == HSL(0, 0, 100));
    assert(ColorSpace::rgb_to_hsl({128, 128, 128}) == HSL(0, 0, 50));

    assert(ColorSpace::hsl_to_rgb({0, 100, 50}) == RGB(255, 0, 0));
    assert(ColorSpace::hsl_to_rgb({0, 0, 0}) == RGB(0, 0, 0));
}

TEST(hsl_hue_wraps) {
    assert(ColorSpace::hsl_to_rgb({360, 100, 50}) == ColorSpace::hsl_to_rgb({0, 100, 50}));
    assert(ColorSpace::hsl_to_rgb({-120, 100, 50}) == RGB(0, 0, 255));
    assert(ColorSpace::hsl_to_rgb({0, 150, 50}) == ColorSpace::hsl_to_rgb({0, 100, 50}));
}

TEST(hsl_round_trip_tolerance) {
    for (int r = 0; r <= 255; r += 15) {
        for (int g = 0; g <= 255; g += 15) {
            for (int b = 0; b <= 255; b += 15) {
                RGB back = ColorSpace::hsl_to_rgb(ColorSpace::rgb_to_hsl({r, g, b}));
                assert(std::abs(back.r - r) <= 3);
                assert(std::abs(back.g - g) <= 3);
                assert(std::abs(back.b - b) <= 3);
            }
        }
    }
}

TEST(delta_e_properties) {
    RGB a(12, 200, 80);
    RGB b(240, 10, 99);
    assert(ColorSpace::delta_e(a, a) == 0.0f);
    assert(std::abs(ColorSpace::delta_e(a, b) - ColorSpace::delta_e(b, a)) < 1e-4f);
    assert(std::abs(ColorSpace::delta_e({0, 0, 0}, {255, 255, 255}) - 100.0f) < 0.5f);
}

TEST(delta_e_stable_across_init) {
    RGB a(33, 66, 99);
    RGB b(99, 66, 33);
    float before = ColorSpace::delta_e(a, b);
    ColorSpace::init();
    float after = ColorSpace::delta_e(a, b);
    assert(std::abs(before - after) < 1e-4f);
}

TEST(contrast_ratio_bounds) {
    float bw = ColorSpace::contrast_ratio({0, 0, 0}, {255, 255, 255});
    assert(std::abs(bw - 21.0f) < 0.01f);
    assert(std::abs(ColorSpace::contrast_ratio({90, 90, 90}, {90, 90, 90}) - 1.0f) < 1e-5f);

    float c = ColorSpace::contrast_ratio({200, 30, 30}, {20, 20, 60});
    assert(c >= 1.0f && c <= 21.0f);
    assert(std::abs(c - ColorSpace::contrast_ratio({20, 20, 60}, {200, 30, 30})) < 1e-5f);
}

TEST(light_dark_and_text_color) {
    assert(ColorSpace::is_light_color({255, 255, 255}));
    assert(!ColorSpace::is_light_color({0, 0, 0}));
    assert(ColorSpace::is_light_color({255, 255, 0}));
    assert(ColorSpace::text_color({255, 255, 255}) == RGB(0, 0, 0));
    assert(ColorSpace::text_color({0, 0, 128}) == RGB(255, 255, 255));
}

TEST(hsl_adjustments_clamp) {
    assert(ColorSpace::lighten({10, 50, 90}, 20) == HSL(10, 50, 100));
    assert(ColorSpace::darken({10, 50, 10}, 20) == HSL(10, 50, 0));
    assert(ColorSpace::saturate({10, 90, 50}, 20) == HSL(10, 100, 50));
    assert(ColorSpace::desaturate({10, 20, 50}, 30) == HSL(10, 0, 50));
    assert(ColorSpace::lighten({10, 50, 40}, 20) == HSL(10, 50, 60));
}

TEST(harmony_helpers) {
    HSL base(200, 50, 40);
    assert(ColorSpace::complementary(base) == HSL(20, 50, 40));
    auto [a1, a2] = ColorSpace::analogous(base);
    assert(a1.h == 230 && a2.h == 170);
    auto [t1, t2] = ColorSpace::triadic(base);
    assert(t1.h == 320 && t2.h == 80);
    auto [s1, s2] = ColorSpace::split_complementary(base);
    assert(s1.h == 350 && s2.h == 50);
    assert(s1.s == 50 && s1.l == 40);
}

TEST(color_name_exact_entries) {
    const auto& table = named_colors();
    for (size_t i = 0; i < table.size(); ++i) {
        std::string expected = table[i].name;
        for (size_t j = 0; j < i; ++j) {
            if (table[j].rgb == table[i].rgb) {
                expected = table[j].name;
                break;
            }
        }
        assert(color_name(table[i].rgb) == expected);
    }
    assert(color_name({255, 0, 0}) == "Red");
    assert(color_name({0, 0, 255}) == "Blue");
}

TEST(color_name_shade_prefix) {
    assert(color_name({187, 17, 187}) == "Light Purple");

    for (int v = 0; v <= 255; v += 51) {
        RGB q(v, 255 - v, (v * 7) % 256);
        const NamedColor& entry = nearest_named_color(q);
        float mean_q = (q.r + q.g + q.b) / 3.0f;
        float mean_e = (entry.rgb.r + entry.rgb.g + entry.rgb.b) / 3.0f;
        std::string name = color_name(q);
        if (mean_q < mean_e - 40.0f) assert(name == std::string("Dark ") + entry.name);
        else if (mean_q > mean_e + 40.0f) assert(name == std::string("Light ") + entry.name);
        else assert(name == entry.name);
    }
}

TEST(dictionary_queries) {
    assert(all_named_colors().size() == 131);
    assert(colors_by_category("red").size() == 13);
    assert(colors_by_category("Blue").size() == 18);
    assert(colors_by_category("special").size() == 3);
    assert(colors_by_category("teal").empty());
    assert(colors_by_family(ColorFamily::Neutral).size() == 18);

    size_t total = 0;
    for (const char* key : {"red", "orange", "yellow", "green", "blue", "purple",
                            "pink", "brown", "neutral", "special"}) {
        total += colors_by_category(key).size();
    }
    assert(total == 131);

    auto gold = search_colors_by_name("GOLD");
    assert(gold.size() == 2);
    assert(std::string(gold[0].name) == "Gold");
    assert(std::string(gold[1].name) == "Rose Gold");
    assert(search_colors_by_name("zzz").empty());
}

TEST(harmony_schemes_exact) {
    Color base = make_color(HSL(200, 60, 45));
    auto schemes = harmony_suggestions(base);
    assert(schemes.size() == 6);

    const int expected[6][4] = {
        {200, 20, -1, -1},
        {170, 200, 230, -1},
        {200, 320, 80, -1},
        {200, 350, 50, -1},
        {200, 260, 20, 80},
        {200, 290, 20, 110},
    };
    for (size_t i = 0; i < schemes.size(); ++i) {
        const auto& scheme = schemes[i];
        for (size_t j = 0; j < scheme.colors.size(); ++j) {
            assert(scheme.colors[j].hsl.h == expected[i][j]);
            assert(scheme.colors[j].hsl.s == 60);
            assert(scheme.colors[j].hsl.l == 45);
        }
        size_t n = 0;
        while (n < 4 && expected[i][n] >= 0) ++n;
        assert(scheme.colors.size() == n);
    }

    assert(schemes[0].name == "Complementary");
    assert(schemes[3].name == "Split-Complementary");
    assert(schemes[4].name == "Tetradic (Rectangle)");
    assert(schemes[1].colors[1].hex == base.hex);
}

TEST(palette_from_color) {
    auto palette = generate_palette_from_color({255, 0, 0});
    assert(palette.size() == 5);
    assert(palette[0].hex == "#FF0000");
    assert(palette[1].hsl.h == 180);
    assert(palette[2].hsl.h == 30);
    assert(palette[3].hsl.h == 330);
    assert(palette[4].hsl.h == 120);

    assert(generate_palette_from_color({255, 0, 0}, 1).size() == 1);
    assert(generate_palette_from_color({255, 0, 0}, 0).size() == 1);
    assert(generate_palette_from_color({255, 0, 0}, 3).size() == 3);
}

TEST(advisor_single_red) {
    std::vector<Color> palette = {make_color(RGB(255, 0, 0))};
    auto s = completion_suggestions(palette);
    assert(s.size() == 5);

    assert(s[0].type == SuggestionType::Lighter);
    assert(s[0].color.hsl == HSL(0, 100, 70));
    assert(s[1].type == SuggestionType::Darker);
    assert(s[1].color.hsl == HSL(0, 100, 30));
    assert(s[2].type == SuggestionType::Desaturated);
    assert(s[2].name == "Muted Variant");
    assert(s[2].color.hsl == HSL(0, 70, 50));
    assert(s[3].type == SuggestionType::GapFill);
    assert(s[3].color.hsl == HSL(180, 100, 50));
    assert(s[3].reason == "Fill the gap in the color wheel (around 180°)");
    assert(s[4].type == SuggestionType::Harmony);
    assert(s[4].name == "Complementary Accent");
    assert(s[4].color.hex == "#00FFFF");
}

TEST(advisor_limits_and_empty) {
    assert(completion_suggestions({}).empty());

    std::vector<Color> palette = {make_color(RGB(255, 0, 0))};
    auto s = completion_suggestions(palette, 2);
    assert(s.size() == 2);
    assert(s[0].type == SuggestionType::Lighter);
    assert(s[1].type == SuggestionType::Darker);
}

TEST(advisor_complement_present) {
    std::vector<Color> palette = {make_color(HSL(0, 50, 50)), make_color(HSL(190, 50, 50))};
    auto s = completion_suggestions(palette, 32);
    for (const auto& item : s) {
        assert(item.type != SuggestionType::Harmony);
    }
}

TEST(gradients_two_colors) {
    std::vector<Color> colors = {hex_color("#000000"), hex_color("#FFFFFF")};
    auto g = gradient_suggestions(colors);
    assert(g.size() == 4);

    assert(g[0].name == "Full Palette Gradient");
    assert(g[0].css == "linear-gradient(90deg, #000000 0%, #FFFFFF 100%)");

    assert(g[1].name == "Smooth Transition");
    assert(g[1].stops.size() == 5);
    assert(g[1].css == "linear-gradient(90deg, #000000 0%, #404040 25%, #808080 50%, #BFBFBF 75%, #FFFFFF 100%)");

    assert(g[2].name == "High Contrast Duotone");
    assert(g[2].css == "linear-gradient(90deg, #000000 0%, #FFFFFF 100%)");

    assert(g[3].name == "Radial Gradient");
    assert(g[3].kind == GradientKind::Radial);
    assert(g[3].css == "radial-gradient(circle, #000000 0%, #FFFFFF 100%)");
}

TEST(gradients_three_colors) {
    std::vector<Color> colors = {hex_color("#FF0000"), hex_color("#00FF00"), hex_color("#0000FF")};
    auto g = gradient_suggestions(colors);
    assert(g.size() == 5);
    assert(g[0].css == "linear-gradient(90deg, #FF0000 0%, #00FF00 50%, #0000FF 100%)");
    assert(g[2].css == "linear-gradient(90deg, #00FF00 0%, #0000FF 100%)");
    assert(g[4].name == "Conic Gradient");
    assert(g[4].css == "conic-gradient(from 0deg, #FF0000 0deg, #00FF00 120deg, #0000FF 240deg, #FF0000 360deg)");
    assert(std::abs(g[0].stops[1].position - 50.0f) < 1e-4f);
}

TEST(gradients_too_few) {
    assert(gradient_suggestions({}).empty());
    assert(gradient_suggestions({hex_color("#123456")}).empty());
}

TEST(similarity_scores) {
    std::vector<Color> red = {hex_color("#FF0000")};
    std::vector<Color> red_blue = {hex_color("#FF0000"), hex_color("#0000FF")};

    assert(std::abs(best_similarity(red, red) - 100.0f) < 1e-4f);
    assert(best_similarity(red, {}) == 0.0f);
    assert(best_similarity({}, red) == 0.0f);

    float forward = best_similarity(red, red_blue);
    float backward = best_similarity(red_blue, red);
    assert(std::abs(forward - 100.0f) < 1e-4f);
    assert(backward < forward);
}

TEST(similarity_ranking) {
    std::vector<Color> mine = {hex_color("#FF0000"), hex_color("#00FF00")};
    std::vector<CandidatePalette> candidates = {
        {"far", "Night", {hex_color("#000000")}},
        {"same", "Same", mine},
        {"empty", "Empty", {}},
        {"near", "Near", {hex_color("#F00000"), hex_color("#00F000")}},
    };

    auto ranked = rank_similar_palettes(mine, candidates);
    assert(ranked.size() == 2);
    assert(ranked[0].palette.id == "same");
    assert(ranked[1].palette.id == "near");
    assert(ranked[0].similarity >= ranked[1].similarity);

    auto limited = rank_similar_palettes(mine, candidates, 30.0f, 1);
    assert(limited.size() == 1);
}

TEST(terminal_rgb_to_256) {
    assert(Terminal::rgb_to_256(255, 0, 0) == 9);
    assert(Terminal::rgb_to_256(0, 0, 0) == 0);
    assert(Terminal::rgb_to_256(95, 135, 175) == 67);
    assert(Terminal::rgb_to_256(118, 118, 118) == 243);
    assert(Terminal::rgb_to_256(128, 128, 128) == 8);
}

TEST(terminal_rgb_to_16) {
    assert(Terminal::rgb_to_16(255, 255, 255) == 15);
    assert(Terminal::rgb_to_16(0, 0, 0) == 0);
    assert(Terminal::rgb_to_16(250, 5, 5) == 9);
}

TEST(terminal_color_codes) {
    assert(Terminal::color_code(ColorMode::None, 1, 2, 3, true).empty());
    assert(Terminal::color_code(ColorMode::Truecolor, 1, 2, 3, true) == "\033[38;2;1;2;3m");
    assert(Terminal::color_code(ColorMode::Truecolor, RGB(1, 2, 3), false) == "\033[48;2;1;2;3m");
    assert(Terminal::color_code(ColorMode::Ansi16, 255, 0, 0, true) == "\033[91m");
    assert(Terminal::color_code(ColorMode::Ansi256, 255, 0, 0, false) == "\033[48;5;9m");
    assert(Terminal::reset_code(ColorMode::None).empty());

    assert(parse_color_mode("256") == ColorMode::Ansi256);
    assert(!parse_color_mode("blockart").has_value());
}

int main() {
    std::cout << "=== Chroma Engine Comprehensive Test Suite ===\n\n";

    std::cout << "--- Color Space Tests ---\n";
    RUN_TEST(color_types_are_literal);
    RUN_TEST(hex_encode);
    RUN_TEST(hex_decode);
    RUN_TEST(hex_decode_rejects_malformed);
    RUN_TEST(make_color_from_hex_normalizes);
    RUN_TEST(hsl_known_values);
    RUN_TEST(hsl_hue_wraps);
    RUN_TEST(hsl_round_trip_tolerance);
    RUN_TEST(delta_e_properties);
    RUN_TEST(delta_e_stable_across_init);
    RUN_TEST(contrast_ratio_bounds);
    RUN_TEST(light_dark_and_text_color);
    RUN_TEST(hsl_adjustments_clamp);
    RUN_TEST(harmony_helpers);

    std::cout << "\n--- Naming Tests ---\n";
    RUN_TEST(color_name_exact_entries);
    RUN_TEST(color_name_shade_prefix);
    RUN_TEST(dictionary_queries);

    std::cout << "\n--- Harmony Tests ---\n";
    RUN_TEST(harmony_schemes_exact);
    RUN_TEST(palette_from_color);

    std::cout << "\n--- Advisor Tests ---\n";
    RUN_TEST(advisor_single_red);
    RUN_TEST(advisor_limits_and_empty);
    RUN_TEST(advisor_complement_present);

    std::cout << "\n--- Gradient Tests ---\n";
    RUN_TEST(gradients_two_colors);
    RUN_TEST(gradients_three_colors);
    RUN_TEST(gradients_too_few);

    std::cout << "\n--- Similarity Tests ---\n";
    RUN_TEST(similarity_scores);
    RUN_TEST(similarity_ranking);

    std::cout << "\n--- Terminal Tests ---\n";
    RUN_TEST(terminal_rgb_to_256);
    RUN_TEST(terminal_rgb_to_16);
    RUN_TEST(terminal_color_codes);

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
