#pragma once

#include "core/types.hpp"
#include <array>

namespace chroma {

enum class ColorFamily {
    Red,
    Orange,
    Yellow,
    Green,
    Blue,
    Purple,
    Pink,
    Brown,
    Neutral,
    Special
};

struct NamedColor {
    const char* name;
    RGB rgb;
    ColorFamily family;
};

inline constexpr size_t kNamedColorCount = 131;

const std::array<NamedColor, kNamedColorCount>& named_colors();

}
