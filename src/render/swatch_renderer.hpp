#pragma once

#include "core/types.hpp"
#include "terminal/terminal.hpp"
#include "extract/extractor.hpp"
#include "advise/harmony.hpp"
#include "advise/palette_advisor.hpp"
#include "advise/gradient.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chroma {

struct PaletteReport {
    std::string source;
    ExtractionResult result;
    std::vector<HarmonySuggestion> harmonies;
    std::vector<CompletionSuggestion> suggestions;
    std::vector<GradientSuggestion> gradients;
    std::vector<Color> compared;
    std::optional<float> similarity;
};

class SwatchRenderer {
public:
    struct Config {
        ColorMode color_mode = ColorMode::None;
        bool swatches = true;
        int swatch_width = 8;
    };

    SwatchRenderer() : SwatchRenderer(Config{}) {}
    explicit SwatchRenderer(const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    std::string render_text(const PaletteReport& report);
    std::string render_json(const PaletteReport& report);

    // One line: swatch, hex, name, rgb and hsl.
    std::string render_color_line(const Color& color);

    static std::string json_escape(const std::string& s);

private:
    Config config_;
    std::string out_;

    void append(const std::string& s);
    void append_number(int v);
    void append_number(double v, int precision);
    void append_swatch(const Color& color, const std::string& label);
    void append_color_row(const Color& color);

    void append_json_color(const Color& color);
    void append_json_string(const std::string& s);
};

}
