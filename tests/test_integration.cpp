#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/config.hpp"
#include "../src/core/color_space.hpp"
#include "../src/cli/args.hpp"
#include "../src/extract/extractor.hpp"
#include "../src/io/image_loader.hpp"
#include "../src/render/swatch_renderer.hpp"
#include "../src/advise/harmony.hpp"
#include "../src/advise/palette_advisor.hpp"
#include "../src/advise/gradient.hpp"
#include "../src/advise/similarity.hpp"

using namespace chroma;
namespace fs = std::filesystem;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static fs::path scratch_dir() {
    fs::path dir = fs::temp_directory_path() / "chroma_engine_integration_test";
    fs::create_directories(dir);
    return dir;
}

static void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

static void put_le(std::vector<uint8_t>& v, uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        v.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

// 24-bit uncompressed BMP, bottom-up rows padded to 4 bytes.
static void write_bmp(const fs::path& path, int w, int h, const std::vector<RGB>& pixels) {
    const uint32_t row_bytes = (static_cast<uint32_t>(w) * 3 + 3) & ~3u;
    const uint32_t image_bytes = row_bytes * static_cast<uint32_t>(h);

    std::vector<uint8_t> bmp;
    bmp.push_back('B');
    bmp.push_back('M');
    put_le(bmp, 54 + image_bytes, 4);
    put_le(bmp, 0, 4);
    put_le(bmp, 54, 4);
    put_le(bmp, 40, 4);
    put_le(bmp, static_cast<uint32_t>(w), 4);
    put_le(bmp, static_cast<uint32_t>(h), 4);
    put_le(bmp, 1, 2);
    put_le(bmp, 24, 2);
    put_le(bmp, 0, 4);
    put_le(bmp, image_bytes, 4);
    put_le(bmp, 2835, 4);
    put_le(bmp, 2835, 4);
    put_le(bmp, 0, 4);
    put_le(bmp, 0, 4);

    for (int y = h - 1; y >= 0; --y) {
        for (int x = 0; x < w; ++x) {
            const RGB& p = pixels[static_cast<size_t>(y) * w + x];
            bmp.push_back(static_cast<uint8_t>(p.b));
            bmp.push_back(static_cast<uint8_t>(p.g));
            bmp.push_back(static_cast<uint8_t>(p.r));
        }
        for (uint32_t pad = static_cast<uint32_t>(w) * 3; pad < row_bytes; ++pad) {
            bmp.push_back(0);
        }
    }

    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bmp.data()), static_cast<std::streamsize>(bmp.size()));
}

static Args parse(std::vector<std::string> words) {
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(w.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

TEST(config_defaults_valid) {
    Config cfg = Config::defaults();
    std::string error;
    assert(cfg.validate(error));
    assert(cfg.extraction.color_count == 6);
    assert(cfg.extraction.max_samples == 40000);
    assert(cfg.output.format == "text");

    std::string path = Config::default_config_path();
    assert(path.size() > 25);
    assert(path.substr(path.size() - 25) == "chroma-engine/config.toml");
}

TEST(config_load_toml) {
    fs::path file = scratch_dir() / "good.toml";
    write_text(file,
        "version = 1\n"
        "[extraction]\n"
        "color_count = 4\n"
        "max_samples = 1000\n"
        "dedup_threshold = 12.5\n"
        "include_transparent = true\n"
        "[advisor]\n"
        "max_suggestions = 3\n"
        "[output]\n"
        "format = \"json\"\n"
        "harmonies = true\n");

    auto cfg = Config::load(file.string());
    assert(cfg.has_value());
    assert(cfg->extraction.color_count == 4);
    assert(cfg->extraction.max_samples == 1000);
    assert(std::abs(cfg->extraction.dedup_threshold - 12.5f) < 1e-5f);
    assert(cfg->extraction.include_transparent);
    assert(cfg->extraction.kmeans_iterations == 8);
    assert(cfg->advisor.max_suggestions == 3);
    assert(cfg->output.format == "json");
    assert(cfg->output.harmonies);
    assert(cfg->config_path == file.string());

    ColorExtractor::Config ec = cfg->extractor_config();
    assert(ec.color_count == 4);
    assert(ec.max_samples == 1000);
}

TEST(config_load_rejects_bad_files) {
    fs::path dir = scratch_dir();
    std::string error;

    assert(!Config::load((dir / "missing.toml").string(), error).has_value());
    assert(error.find("not found") != std::string::npos);

    write_text(dir / "range.toml", "[extraction]\ncolor_count = 100\n");
    error.clear();
    assert(!Config::load((dir / "range.toml").string(), error).has_value());
    assert(error.find("color_count") != std::string::npos);

    write_text(dir / "version.toml", "version = 2\n");
    assert(!Config::load((dir / "version.toml").string()).has_value());

    write_text(dir / "syntax.toml", "[extraction\ncolor_count = = 3\n");
    error.clear();
    assert(!Config::load((dir / "syntax.toml").string(), error).has_value());
    assert(error.find("Failed to parse") != std::string::npos);

    write_text(dir / "format.toml", "[output]\nformat = \"xml\"\n");
    assert(!Config::load((dir / "format.toml").string()).has_value());
}

TEST(config_merge_and_cli_precedence) {
    Config file_cfg = Config::defaults();
    file_cfg.extraction.color_count = 4;
    file_cfg.output.gradients = true;

    Config merged = merge_config(Config::defaults(), file_cfg);
    assert(merged.extraction.color_count == 4);
    assert(merged.output.gradients);
    assert(merged.extraction.max_samples == 40000);

    Args args = parse({"chroma", "-n", "9", "--format", "json", "--no-swatch", "photo.png"});
    Config final_cfg = apply_cli_overrides(merged, args);
    assert(final_cfg.extraction.color_count == 9);
    assert(final_cfg.output.format == "json");
    assert(!final_cfg.output.swatches);
    assert(final_cfg.output.gradients);
}

TEST(args_parsing) {
    Args args = parse({"chroma", "--colors", "12", "--include-transparent", "--harmony",
                       "--suggest", "--gradients", "--compare", "#FF0000,00ff00",
                       "--color", "256", "--profile-live", "image.jpg"});
    assert(args.errors.empty());
    assert(args.colors == 12);
    assert(args.include_transparent);
    assert(args.harmony && args.suggest && args.gradients);
    assert(args.compare_hex.size() == 2);
    assert(args.compare_hex[1] == "00ff00");
    assert(args.color_mode == "256");
    assert(args.profile_live);
    assert(args.input == "image.jpg");

    assert(parse({"chroma", "-n", "500"}).colors == 6);
    assert(parse({"chroma", "-h", "--bogus"}).show_help);
    assert(parse({"chroma", "--name", "#123456"}).name_hex == "#123456");
}

TEST(args_errors) {
    assert(!parse({"chroma", "--format", "xml"}).errors.empty());
    assert(!parse({"chroma", "--color", "blockart"}).errors.empty());
    assert(!parse({"chroma", "--bogus"}).errors.empty());
    assert(!parse({"chroma", "--config"}).errors.empty());

    Args traversal = parse({"chroma", "../secret.png"});
    assert(traversal.input.empty());
    assert(!traversal.errors.empty());
}

TEST(loader_error_paths) {
    PixelBuffer img;
    assert(ImageLoader::load("", img).error == ErrorCode::INVALID_ARGUMENT);
    assert(ImageLoader::load("../etc/passwd.png", img).error == ErrorCode::INVALID_ARGUMENT);

    fs::path missing = scratch_dir() / "does_not_exist.png";
    assert(ImageLoader::load(missing.string(), img).error == ErrorCode::FILE_NOT_FOUND);

    fs::path garbage = scratch_dir() / "garbage.png";
    write_text(garbage, "this is not an image at all");
    Result r = ImageLoader::load(garbage.string(), img);
    assert(r.error == ErrorCode::INVALID_FORMAT);
    assert(img.empty());

    assert(ImageLoader::load_from_memory(nullptr, 0, img).error == ErrorCode::INVALID_ARGUMENT);
}

TEST(loader_extensions) {
    assert(ImageLoader::is_supported_extension("photo.PNG"));
    assert(ImageLoader::is_supported_extension("a/b/c.jpeg"));
    assert(ImageLoader::is_supported_extension("scan.bmp"));
    assert(!ImageLoader::is_supported_extension("notes.txt"));
    assert(!ImageLoader::is_supported_extension("png"));
}

TEST(end_to_end_bmp_extraction) {
    const int w = 20;
    const int h = 10;
    std::vector<RGB> pixels(static_cast<size_t>(w) * h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            pixels[static_cast<size_t>(y) * w + x] = x < 15 ? RGB(255, 0, 0) : RGB(0, 0, 255);
        }
    }
    fs::path file = scratch_dir() / "two_tone.bmp";
    write_bmp(file, w, h, pixels);

    PixelBuffer img;
    Result load = ImageLoader::load(file.string(), img);
    assert(load.success());
    assert(img.width() == w && img.height() == h);
    assert(img.get_pixel(0, 0).a == 255);
    assert(img.get_pixel(19, 9).rgb() == RGB(0, 0, 255));

    ColorExtractor extractor;
    ExtractionResult result;
    assert(extractor.extract(img, result).success());
    assert(result.colors.size() == 2);
    assert(result.colors[0].hex == "#FF0000");
    assert(std::abs(*result.colors[0].percentage - 75.0f) < 1e-4f);
    assert(result.colors[1].hex == "#0000FF");
    assert(std::abs(*result.colors[1].percentage - 25.0f) < 1e-4f);
    assert(result.dominant_color.name && *result.dominant_color.name == "Red");
}

TEST(end_to_end_report_rendering) {
    std::vector<uint8_t> rgba;
    for (int i = 0; i < 30; ++i) rgba.insert(rgba.end(), {255, 0, 0, 255});
    for (int i = 0; i < 10; ++i) rgba.insert(rgba.end(), {255, 255, 255, 255});

    PaletteReport report;
    report.source = "in\"line.png";
    ExtractionOptions options;
    options.color_count = 4;
    assert(extract_colors(rgba.data(), rgba.size(), 40, 1, options, report.result).success());
    report.harmonies = harmony_suggestions(report.result.dominant_color);
    report.suggestions = completion_suggestions(report.result.colors);
    report.gradients = gradient_suggestions(report.result.colors);
    report.compared.push_back(make_color(RGB(255, 0, 0)));
    report.similarity = best_similarity(report.result.colors, report.compared);

    SwatchRenderer::Config cfg;
    cfg.color_mode = ColorMode::None;
    SwatchRenderer renderer(cfg);

    std::string text = renderer.render_text(report);
    assert(text.find("#FF0000") != std::string::npos);
    assert(text.find("75.0%") != std::string::npos);
    assert(text.find("Harmonies") != std::string::npos);
    assert(text.find("linear-gradient(90deg, #FF0000 0%, #FFFFFF 100%)") != std::string::npos);
    assert(text.find("\033[") == std::string::npos);

    std::string json = renderer.render_json(report);
    assert(json.find("\"source\":\"in\\\"line.png\"") != std::string::npos);
    assert(json.find("\"hex\":\"#FF0000\"") != std::string::npos);
    assert(json.find("\"percentage\":75.0") != std::string::npos);
    assert(json.find("\"dominantColor\"") != std::string::npos);
    assert(json.find("\"similarity\":") != std::string::npos);
    assert(json.front() == '{');

    cfg.color_mode = ColorMode::Truecolor;
    renderer.set_config(cfg);
    std::string colored = renderer.render_text(report);
    assert(colored.find("\033[48;2;255;0;0m") != std::string::npos);
}

TEST(json_escape) {
    assert(SwatchRenderer::json_escape("plain") == "plain");
    assert(SwatchRenderer::json_escape("a\"b\\c") == "a\\\"b\\\\c");
    assert(SwatchRenderer::json_escape("line\nbreak") == "line\\nbreak");
    assert(SwatchRenderer::json_escape(std::string(1, '\x01')) == "\\u0001");
}

int main() {
    std::cout << "=== Chroma Engine Integration Test Suite ===\n\n";

    RUN_TEST(config_defaults_valid);
    RUN_TEST(config_load_toml);
    RUN_TEST(config_load_rejects_bad_files);
    RUN_TEST(config_merge_and_cli_precedence);
    RUN_TEST(args_parsing);
    RUN_TEST(args_errors);
    RUN_TEST(loader_error_paths);
    RUN_TEST(loader_extensions);
    RUN_TEST(end_to_end_bmp_extraction);
    RUN_TEST(end_to_end_report_rendering);
    RUN_TEST(json_escape);

    std::error_code ec;
    fs::remove_all(scratch_dir(), ec);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll integration tests passed.\n";
        return 0;
    }

    std::cout << "\nSome integration tests failed.\n";
    return 1;
}
