#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace chroma {

enum class GradientKind { Linear, Radial, Conic };

struct GradientStop {
    Color color;
    float position = 0.0f;  // 0..100
};

struct GradientSuggestion {
    std::string name;
    GradientKind kind = GradientKind::Linear;
    std::vector<GradientStop> stops;
    std::string css;
};

// Full palette, smooth transition, high-contrast duotone, radial and (for
// three or more colors) conic. Fewer than two colors gives an empty list.
std::vector<GradientSuggestion> gradient_suggestions(const std::vector<Color>& colors);

// steps >= 2 stops evenly spaced from start to end, RGB channels rounded.
std::vector<GradientStop> smooth_gradient(const Color& start, const Color& end, int steps);

const char* gradient_kind_name(GradientKind kind);

}
