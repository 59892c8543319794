#include "advise/gradient.hpp"
#include "core/color_space.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace chroma {

namespace {

constexpr int kSmoothSteps = 5;

std::string format_position(float position) {
    std::ostringstream ss;
    ss << position;
    return ss.str();
}

std::string join_percent_stops(const std::vector<Color>& colors) {
    std::string out;
    const size_t n = colors.size();
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) out += ", ";
        long pct = std::lround(static_cast<double>(i) / (n - 1) * 100.0);
        out += colors[i].hex + " " + std::to_string(pct) + "%";
    }
    return out;
}

std::vector<GradientStop> palette_stops(const std::vector<Color>& colors) {
    std::vector<GradientStop> stops;
    const size_t n = colors.size();
    for (size_t i = 0; i < n; ++i) {
        stops.push_back({colors[i], static_cast<float>(static_cast<double>(i) / (n - 1) * 100.0)});
    }
    return stops;
}

}

const char* gradient_kind_name(GradientKind kind) {
    switch (kind) {
        case GradientKind::Linear: return "linear";
        case GradientKind::Radial: return "radial";
        case GradientKind::Conic: return "conic";
    }
    return "unknown";
}

std::vector<GradientStop> smooth_gradient(const Color& start, const Color& end, int steps) {
    steps = std::max(2, steps);
    std::vector<GradientStop> stops;
    stops.reserve(steps);

    for (int i = 0; i < steps; ++i) {
        double t = static_cast<double>(i) / (steps - 1);
        auto lerp = [t](int a, int b) {
            return static_cast<int>(std::lround(a + (b - a) * t));
        };
        RGB rgb(lerp(start.rgb.r, end.rgb.r),
                lerp(start.rgb.g, end.rgb.g),
                lerp(start.rgb.b, end.rgb.b));
        stops.push_back({make_color(rgb), static_cast<float>(t * 100.0)});
    }
    return stops;
}

std::vector<GradientSuggestion> gradient_suggestions(const std::vector<Color>& colors) {
    std::vector<GradientSuggestion> out;
    const size_t n = colors.size();
    if (n < 2) return out;

    const std::vector<GradientStop> all_stops = palette_stops(colors);

    out.push_back({"Full Palette Gradient", GradientKind::Linear, all_stops,
                   "linear-gradient(90deg, " + join_percent_stops(colors) + ")"});

    {
        std::vector<GradientStop> stops = smooth_gradient(colors.front(), colors.back(), kSmoothSteps);
        std::string css = "linear-gradient(90deg, ";
        for (size_t i = 0; i < stops.size(); ++i) {
            if (i > 0) css += ", ";
            css += stops[i].color.hex + " " + format_position(stops[i].position) + "%";
        }
        css += ")";
        out.push_back({"Smooth Transition", GradientKind::Linear, std::move(stops), std::move(css)});
    }

    {
        float max_contrast = 0.0f;
        size_t first = 0;
        size_t second = 1;
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                float contrast = ColorSpace::delta_e(colors[i].rgb, colors[j].rgb);
                if (contrast > max_contrast) {
                    max_contrast = contrast;
                    first = i;
                    second = j;
                }
            }
        }
        const Color& a = colors[first];
        const Color& b = colors[second];
        out.push_back({"High Contrast Duotone", GradientKind::Linear,
                       {{a, 0.0f}, {b, 100.0f}},
                       "linear-gradient(90deg, " + a.hex + " 0%, " + b.hex + " 100%)"});
    }

    out.push_back({"Radial Gradient", GradientKind::Radial, all_stops,
                   "radial-gradient(circle, " + join_percent_stops(colors) + ")"});

    if (n >= 3) {
        std::string css = "conic-gradient(from 0deg, ";
        for (size_t i = 0; i < n; ++i) {
            long deg = std::lround(static_cast<double>(i) / n * 360.0);
            css += colors[i].hex + " " + std::to_string(deg) + "deg, ";
        }
        css += colors[0].hex + " 360deg)";
        out.push_back({"Conic Gradient", GradientKind::Conic, all_stops, std::move(css)});
    }

    return out;
}

}
