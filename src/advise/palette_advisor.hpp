#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace chroma {

enum class SuggestionType {
    Lighter,
    Darker,
    Saturated,
    Desaturated,
    Harmony,
    GapFill
};

struct CompletionSuggestion {
    SuggestionType type;
    std::string name;
    Color color;
    std::string reason;
};

const char* suggestion_type_name(SuggestionType type);

class PaletteAdvisor {
public:
    struct Config {
        int max_suggestions = 6;
        int shade_step = 20;
        int mute_step = 30;
        int vibrance_step = 20;
        int min_hue_gap = 60;
        int max_gap_fills = 2;
        int complement_window = 30;
    };

    PaletteAdvisor() : PaletteAdvisor(Config{}) {}
    explicit PaletteAdvisor(const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    // colors[0] is treated as the dominant color. Empty input gives no suggestions.
    std::vector<CompletionSuggestion> suggest(const std::vector<Color>& colors) const;

private:
    Config config_;

    void add_gap_fills(const std::vector<Color>& colors, double avg_s, double avg_l,
                       std::vector<CompletionSuggestion>& out) const;
};

std::vector<CompletionSuggestion> completion_suggestions(const std::vector<Color>& colors,
                                                         int max_suggestions = 6);

}
