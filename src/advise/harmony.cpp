#include "advise/harmony.hpp"
#include "core/color_space.hpp"
#include <algorithm>
#include <iterator>

namespace chroma {

namespace {

constexpr HarmonyType kAllTypes[] = {
    HarmonyType::Complementary,
    HarmonyType::Analogous,
    HarmonyType::Triadic,
    HarmonyType::SplitComplementary,
    HarmonyType::Tetradic,
    HarmonyType::Square,
};

const char* harmony_description(HarmonyType type) {
    switch (type) {
        case HarmonyType::Complementary:
            return "Colors opposite on the color wheel. High contrast, vibrant.";
        case HarmonyType::Analogous:
            return "Colors next to each other. Harmonious and pleasing.";
        case HarmonyType::Triadic:
            return "Three colors evenly spaced. Balanced and vibrant.";
        case HarmonyType::SplitComplementary:
            return "Base color + two adjacent to its complement. Vibrant yet balanced.";
        case HarmonyType::Tetradic:
            return "Four colors forming a rectangle. Rich and complex.";
        case HarmonyType::Square:
            return "Four colors evenly spaced. Dynamic and bold.";
    }
    return "";
}

}

const char* harmony_type_name(HarmonyType type) {
    switch (type) {
        case HarmonyType::Complementary: return "Complementary";
        case HarmonyType::Analogous: return "Analogous";
        case HarmonyType::Triadic: return "Triadic";
        case HarmonyType::SplitComplementary: return "Split-Complementary";
        case HarmonyType::Tetradic: return "Tetradic (Rectangle)";
        case HarmonyType::Square: return "Square";
    }
    return "Unknown";
}

std::vector<int> harmony_offsets(HarmonyType type) {
    switch (type) {
        case HarmonyType::Complementary: return {0, 180};
        case HarmonyType::Analogous: return {330, 0, 30};
        case HarmonyType::Triadic: return {0, 120, 240};
        case HarmonyType::SplitComplementary: return {0, 150, 210};
        case HarmonyType::Tetradic: return {0, 60, 180, 240};
        case HarmonyType::Square: return {0, 90, 180, 270};
    }
    return {0};
}

HarmonySuggestion make_harmony(HarmonyType type, const Color& base) {
    HarmonySuggestion suggestion;
    suggestion.type = type;
    suggestion.name = harmony_type_name(type);
    suggestion.description = harmony_description(type);
    for (int offset : harmony_offsets(type)) {
        if (offset == 0) {
            suggestion.colors.push_back(base);
        } else {
            suggestion.colors.push_back(make_color(ColorSpace::rotate_hue(base.hsl, offset)));
        }
    }
    return suggestion;
}

std::vector<HarmonySuggestion> harmony_suggestions(const Color& base) {
    std::vector<HarmonySuggestion> out;
    out.reserve(std::size(kAllTypes));
    for (HarmonyType type : kAllTypes) {
        out.push_back(make_harmony(type, base));
    }
    return out;
}

std::vector<HarmonySuggestion> harmony_suggestions(const HSL& base) {
    return harmony_suggestions(make_color(base));
}

std::vector<Color> generate_palette_from_color(const RGB& base, int count) {
    const Color base_color = make_color(base);
    const HSL& hsl = base_color.hsl;

    std::vector<Color> palette;
    palette.push_back(base_color);
    palette.push_back(make_color(ColorSpace::complementary(hsl)));
    palette.push_back(make_color(ColorSpace::rotate_hue(hsl, 30)));
    palette.push_back(make_color(ColorSpace::rotate_hue(hsl, 330)));
    palette.push_back(make_color(ColorSpace::rotate_hue(hsl, 120)));

    const size_t keep = static_cast<size_t>(std::max(1, count));
    if (palette.size() > keep) {
        palette.resize(keep);
    }
    return palette;
}

}
