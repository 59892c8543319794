#include "advise/palette_advisor.hpp"
#include "core/color_space.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace chroma {

namespace {

struct HueGap {
    int start = 0;
    int gap = 0;
};

}

const char* suggestion_type_name(SuggestionType type) {
    switch (type) {
        case SuggestionType::Lighter: return "lighter";
        case SuggestionType::Darker: return "darker";
        case SuggestionType::Saturated: return "saturated";
        case SuggestionType::Desaturated: return "desaturated";
        case SuggestionType::Harmony: return "harmony";
        case SuggestionType::GapFill: return "gap-fill";
    }
    return "unknown";
}

PaletteAdvisor::PaletteAdvisor(const Config& config) : config_(config) {}

void PaletteAdvisor::add_gap_fills(const std::vector<Color>& colors, double avg_s, double avg_l,
                                   std::vector<CompletionSuggestion>& out) const {
    std::vector<int> hues;
    hues.reserve(colors.size());
    for (const auto& c : colors) hues.push_back(c.hsl.h);
    std::sort(hues.begin(), hues.end());

    std::vector<HueGap> gaps;
    for (size_t i = 0; i < hues.size(); ++i) {
        int current = hues[i];
        int next = hues[(i + 1) % hues.size()];
        int gap = next > current ? next - current : 360 - current + next;
        gaps.push_back({current, gap});
    }
    std::stable_sort(gaps.begin(), gaps.end(),
                     [](const HueGap& a, const HueGap& b) { return a.gap > b.gap; });

    const size_t limit = std::min(gaps.size(), static_cast<size_t>(std::max(0, config_.max_gap_fills)));
    for (size_t i = 0; i < limit; ++i) {
        if (gaps[i].gap <= config_.min_hue_gap) continue;

        double mid = std::fmod(gaps[i].start + gaps[i].gap / 2.0, 360.0);
        int mid_hue = static_cast<int>(std::lround(mid));
        HSL fill(mid_hue, static_cast<int>(std::lround(avg_s)), static_cast<int>(std::lround(avg_l)));

        out.push_back({SuggestionType::GapFill, "Gap Fill", make_color(fill),
                       "Fill the gap in the color wheel (around " + std::to_string(mid_hue) + "°)"});
    }
}

std::vector<CompletionSuggestion> PaletteAdvisor::suggest(const std::vector<Color>& colors) const {
    std::vector<CompletionSuggestion> out;
    if (colors.empty()) return out;

    double sum_s = 0.0;
    double sum_l = 0.0;
    int min_l = 100;
    int max_l = 0;
    for (const auto& c : colors) {
        sum_s += c.hsl.s;
        sum_l += c.hsl.l;
        min_l = std::min(min_l, c.hsl.l);
        max_l = std::max(max_l, c.hsl.l);
    }
    const double avg_s = sum_s / colors.size();
    const double avg_l = sum_l / colors.size();
    const HSL& dominant = colors[0].hsl;

    if (max_l < 85) {
        out.push_back({SuggestionType::Lighter, "Lighter Variant",
                       make_color(ColorSpace::lighten(dominant, config_.shade_step)),
                       "Add a lighter shade for highlights and backgrounds"});
    }
    if (min_l > 20) {
        out.push_back({SuggestionType::Darker, "Darker Variant",
                       make_color(ColorSpace::darken(dominant, config_.shade_step)),
                       "Add a darker shade for text and emphasis"});
    }
    if (avg_s > 30.0) {
        out.push_back({SuggestionType::Desaturated, "Muted Variant",
                       make_color(ColorSpace::desaturate(dominant, config_.mute_step)),
                       "Add a muted tone for subtle elements"});
    }
    if (avg_s < 80.0) {
        out.push_back({SuggestionType::Saturated, "Vibrant Variant",
                       make_color(ColorSpace::saturate(dominant, config_.vibrance_step)),
                       "Add a vibrant accent color"});
    }

    add_gap_fills(colors, avg_s, avg_l, out);

    const int complement = ColorSpace::wrap_hue(dominant.h + 180);
    const int window = config_.complement_window;
    bool has_complement = std::any_of(colors.begin(), colors.end(), [&](const Color& c) {
        int d = std::abs(c.hsl.h - complement);
        return d < window || d > 360 - window;
    });
    if (!has_complement) {
        out.push_back({SuggestionType::Harmony, "Complementary Accent",
                       make_color(HSL(complement, dominant.s, dominant.l)),
                       "Add contrast with a complementary color"});
    }

    const size_t keep = static_cast<size_t>(std::max(0, config_.max_suggestions));
    if (out.size() > keep) out.resize(keep);
    return out;
}

std::vector<CompletionSuggestion> completion_suggestions(const std::vector<Color>& colors,
                                                         int max_suggestions) {
    PaletteAdvisor::Config config;
    config.max_suggestions = max_suggestions;
    return PaletteAdvisor(config).suggest(colors);
}

}
