#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace chroma {

enum class HarmonyType {
    Complementary,
    Analogous,
    Triadic,
    SplitComplementary,
    Tetradic,
    Square
};

struct HarmonySuggestion {
    HarmonyType type;
    std::string name;
    std::string description;
    std::vector<Color> colors;
};

// All six schemes, in enum order. The base color is passed through as is;
// the others keep its saturation and lightness and rotate the hue.
std::vector<HarmonySuggestion> harmony_suggestions(const Color& base);
std::vector<HarmonySuggestion> harmony_suggestions(const HSL& base);

HarmonySuggestion make_harmony(HarmonyType type, const Color& base);

// Hue offsets of a scheme, in output order. 0 is the base itself.
std::vector<int> harmony_offsets(HarmonyType type);

const char* harmony_type_name(HarmonyType type);

// base, complementary, +30, +330, +120; truncated to count (at least the base).
std::vector<Color> generate_palette_from_color(const RGB& base, int count = 5);

}
