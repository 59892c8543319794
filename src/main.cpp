#include "core/types.hpp"
#include "core/config.hpp"
#include "core/color_space.hpp"
#include "extract/extractor.hpp"
#include "naming/color_namer.hpp"
#include "advise/harmony.hpp"
#include "advise/palette_advisor.hpp"
#include "advise/gradient.hpp"
#include "advise/similarity.hpp"
#include "io/image_loader.hpp"
#include "render/swatch_renderer.hpp"
#include "terminal/terminal.hpp"
#include "cli/args.hpp"

#include <iostream>

namespace {

chroma::ColorMode resolve_color_mode(const std::string& setting, const chroma::TerminalInfo& info) {
    if (setting == "auto") {
        return info.color_mode;
    }
    return chroma::parse_color_mode(setting).value_or(chroma::ColorMode::None);
}

int print_name(const std::string& hex, chroma::SwatchRenderer& renderer, bool json) {
    chroma::Color color;
    chroma::Result r = chroma::make_color_from_hex(hex, color);
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return 1;
    }
    color.name = chroma::color_name(color.rgb);

    if (json) {
        std::cout << "{\"hex\":\"" << color.hex << "\",\"name\":\""
                  << chroma::SwatchRenderer::json_escape(*color.name) << "\"}\n";
    } else {
        std::cout << renderer.render_color_line(color);
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    chroma::Args args = chroma::parse_args(argc, argv);

    if (args.show_help) {
        chroma::print_help(argv[0]);
        return 0;
    }

    for (const auto& err : args.errors) {
        std::cerr << "Error: " << err << "\n";
    }
    if (!args.errors.empty()) {
        return 1;
    }

    chroma::Config config = chroma::Config::defaults();
    if (!args.config_path.empty()) {
        std::string load_error;
        auto loaded = chroma::Config::load(args.config_path, load_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << load_error << "\n";
            return 1;
        }
        config = chroma::merge_config(config, *loaded);
    } else {
        if (auto loaded_default = chroma::Config::load_default()) {
            config = chroma::merge_config(config, *loaded_default);
        }
    }
    config = chroma::apply_cli_overrides(config, args);

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    chroma::ColorSpace::init();

    chroma::Terminal terminal;
    const bool json = config.output.format == "json";

    chroma::SwatchRenderer::Config render_cfg;
    render_cfg.color_mode = json ? chroma::ColorMode::None
                                 : resolve_color_mode(config.output.color, terminal.info());
    render_cfg.swatches = config.output.swatches;
    chroma::SwatchRenderer renderer(render_cfg);

    if (!args.name_hex.empty()) {
        return print_name(args.name_hex, renderer, json);
    }

    if (args.input.empty()) {
        std::cerr << "Error: No input specified\n";
        chroma::print_help(argv[0]);
        return 1;
    }

    if (!chroma::ImageLoader::is_supported_extension(args.input)) {
        std::cerr << "Warning: Unrecognized image extension, trying to decode anyway: "
                  << args.input << "\n";
    }

    chroma::PixelBuffer image;
    chroma::Result load_result = chroma::ImageLoader::load(args.input, image);
    if (load_result.failure()) {
        std::cerr << "Error: " << load_result.message << "\n";
        return 1;
    }

    chroma::ColorExtractor extractor(config.extractor_config());
    chroma::PaletteReport report;
    report.source = args.input;

    chroma::Result extract_result = extractor.extract(image, report.result);
    if (config.output.profile_live) {
        const chroma::ExtractionStats& s = extractor.last_stats();
        std::cerr << "{\"sample_ms\":" << s.sample_ms
                  << ",\"median_cut_ms\":" << s.median_cut_ms
                  << ",\"kmeans_ms\":" << s.kmeans_ms
                  << ",\"dedup_ms\":" << s.dedup_ms
                  << ",\"total_ms\":" << s.total_ms
                  << ",\"samples\":" << s.samples
                  << ",\"buckets\":" << s.buckets
                  << ",\"clusters\":" << s.clusters
                  << "}\n";
    }
    if (extract_result.failure()) {
        std::cerr << "Error: " << extract_result.message << " ("
                  << chroma::error_code_name(extract_result.error) << ")\n";
        return 1;
    }

    const std::vector<chroma::Color>& colors = report.result.colors;
    if (config.output.harmonies) {
        report.harmonies = chroma::harmony_suggestions(report.result.dominant_color);
    }
    if (config.output.suggestions) {
        report.suggestions = chroma::completion_suggestions(colors, config.advisor.max_suggestions);
    }
    if (config.output.gradients) {
        report.gradients = chroma::gradient_suggestions(colors);
    }
    if (!args.compare_hex.empty()) {
        for (const auto& hex : args.compare_hex) {
            chroma::Color c;
            chroma::Result r = chroma::make_color_from_hex(hex, c);
            if (r.failure()) {
                std::cerr << "Error: " << r.message << "\n";
                return 1;
            }
            report.compared.push_back(c);
        }
        report.similarity = chroma::best_similarity(colors, report.compared);
    }

    std::cout << (json ? renderer.render_json(report) : renderer.render_text(report));
    std::cout.flush();
    return 0;
}
