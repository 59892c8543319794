#include "naming/color_namer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace chroma {

namespace {

constexpr float kShadeOffset = 40.0f;

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

float channel_mean(const RGB& c) {
    return (c.r + c.g + c.b) / 3.0f;
}

struct Category {
    const char* key;
    ColorFamily family;
};

constexpr Category kCategories[] = {
    {"red", ColorFamily::Red},
    {"orange", ColorFamily::Orange},
    {"yellow", ColorFamily::Yellow},
    {"green", ColorFamily::Green},
    {"blue", ColorFamily::Blue},
    {"purple", ColorFamily::Purple},
    {"pink", ColorFamily::Pink},
    {"brown", ColorFamily::Brown},
    {"neutral", ColorFamily::Neutral},
    {"special", ColorFamily::Special},
};

}

float redmean_distance(const RGB& a, const RGB& b) {
    float r_mean = (a.r + b.r) / 2.0f;
    float dr = static_cast<float>(a.r - b.r);
    float dg = static_cast<float>(a.g - b.g);
    float db = static_cast<float>(a.b - b.b);

    float wr = 2.0f + r_mean / 256.0f;
    float wg = 4.0f;
    float wb = 2.0f + (255.0f - r_mean) / 256.0f;

    return std::sqrt(wr * dr * dr + wg * dg * dg + wb * db * db);
}

const NamedColor& nearest_named_color(const RGB& rgb) {
    const auto& table = named_colors();
    const NamedColor* best = &table[0];
    float best_dist = std::numeric_limits<float>::max();

    for (const auto& entry : table) {
        float d = redmean_distance(rgb, entry.rgb);
        if (d < best_dist) {
            best_dist = d;
            best = &entry;
        }
    }
    return *best;
}

std::string color_name(const RGB& rgb) {
    const NamedColor& entry = nearest_named_color(rgb);

    float lightness = channel_mean(rgb);
    float reference = channel_mean(entry.rgb);

    if (lightness < reference - kShadeOffset) {
        return std::string("Dark ") + entry.name;
    }
    if (lightness > reference + kShadeOffset) {
        return std::string("Light ") + entry.name;
    }
    return entry.name;
}

std::vector<NamedColor> all_named_colors() {
    const auto& table = named_colors();
    return {table.begin(), table.end()};
}

std::vector<NamedColor> colors_by_family(ColorFamily family) {
    std::vector<NamedColor> out;
    for (const auto& entry : named_colors()) {
        if (entry.family == family) {
            out.push_back(entry);
        }
    }
    return out;
}

std::vector<NamedColor> colors_by_category(const std::string& category) {
    std::string key = to_lower(category);
    for (const auto& c : kCategories) {
        if (key == c.key) {
            return colors_by_family(c.family);
        }
    }
    return {};
}

std::vector<NamedColor> search_colors_by_name(const std::string& query) {
    std::string needle = to_lower(query);
    std::vector<NamedColor> out;
    for (const auto& entry : named_colors()) {
        if (to_lower(entry.name).find(needle) != std::string::npos) {
            out.push_back(entry);
        }
    }
    return out;
}

const char* family_name(ColorFamily family) {
    for (const auto& c : kCategories) {
        if (c.family == family) return c.key;
    }
    return "unknown";
}

}
