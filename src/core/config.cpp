#include "core/config.hpp"
#include "cli/args.hpp"
#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <sstream>

#ifdef _WIN32
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace chroma {

namespace {

std::string get_home_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_PROFILE, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return ".";
#else
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
#endif
}

std::string get_app_data_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_APPDATA, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* appdata = std::getenv("APPDATA");
    if (appdata) return std::string(appdata);
    return get_home_dir();
#elif defined(__APPLE__)
    return get_home_dir() + "/Library/Application Support";
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
#endif
}

bool in_range(int v, int lo, int hi) { return v >= lo && v <= hi; }
bool in_range(float v, float lo, float hi) { return v >= lo && v <= hi; }

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/chroma-engine";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (version != CONFIG_VERSION) {
        error = "version must be " + std::to_string(CONFIG_VERSION);
        return false;
    }
    if (!in_range(extraction.color_count, 1, 64)) {
        error = "extraction.color_count must be between 1 and 64";
        return false;
    }
    if (!in_range(extraction.max_samples, 64, 1000000)) {
        error = "extraction.max_samples must be between 64 and 1000000";
        return false;
    }
    if (!in_range(extraction.kmeans_iterations, 1, 64)) {
        error = "extraction.kmeans_iterations must be between 1 and 64";
        return false;
    }
    if (!in_range(extraction.min_cluster_percentage, 0.0f, 100.0f)) {
        error = "extraction.min_cluster_percentage must be between 0 and 100";
        return false;
    }
    if (!in_range(extraction.dedup_threshold, 0.0f, 100.0f)) {
        error = "extraction.dedup_threshold must be between 0 and 100";
        return false;
    }
    if (!in_range(extraction.bucket_factor, 1, 8)) {
        error = "extraction.bucket_factor must be between 1 and 8";
        return false;
    }
    if (!in_range(advisor.max_suggestions, 0, 32)) {
        error = "advisor.max_suggestions must be between 0 and 32";
        return false;
    }
    if (!in_range(advisor.similarity_threshold, 0.0f, 100.0f)) {
        error = "advisor.similarity_threshold must be between 0 and 100";
        return false;
    }
    if (!in_range(advisor.similarity_limit, 1, 1000)) {
        error = "advisor.similarity_limit must be between 1 and 1000";
        return false;
    }
    if (output.format != "text" && output.format != "json") {
        error = "output.format must be text or json";
        return false;
    }
    if (output.color != "auto" && output.color != "none" && output.color != "16" &&
        output.color != "256" && output.color != "truecolor") {
        error = "output.color must be auto, none, 16, 256 or truecolor";
        return false;
    }
    return true;
}

ColorExtractor::Config Config::extractor_config() const {
    ColorExtractor::Config c;
    c.color_count = extraction.color_count;
    c.include_transparent = extraction.include_transparent;
    c.max_samples = extraction.max_samples;
    c.kmeans_iterations = extraction.kmeans_iterations;
    c.min_cluster_percentage = extraction.min_cluster_percentage;
    c.dedup_threshold = extraction.dedup_threshold;
    c.bucket_factor = extraction.bucket_factor;
    return c;
}

std::optional<Config> Config::load(const std::string& path) {
    std::string error;
    return load(path, error);
}

std::optional<Config> Config::load(const std::string& path, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        error = "Config file not found: " + path;
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["version"].value<int>()) cfg.version = *v;

        if (auto extraction = tbl["extraction"]) {
            if (auto v = extraction["color_count"].value<int>()) cfg.extraction.color_count = *v;
            if (auto v = extraction["include_transparent"].value<bool>()) cfg.extraction.include_transparent = *v;
            if (auto v = extraction["max_samples"].value<int>()) cfg.extraction.max_samples = *v;
            if (auto v = extraction["kmeans_iterations"].value<int>()) cfg.extraction.kmeans_iterations = *v;
            if (auto v = extraction["min_cluster_percentage"].value<double>()) cfg.extraction.min_cluster_percentage = static_cast<float>(*v);
            if (auto v = extraction["dedup_threshold"].value<double>()) cfg.extraction.dedup_threshold = static_cast<float>(*v);
            if (auto v = extraction["bucket_factor"].value<int>()) cfg.extraction.bucket_factor = *v;
        }

        if (auto advisor = tbl["advisor"]) {
            if (auto v = advisor["max_suggestions"].value<int>()) cfg.advisor.max_suggestions = *v;
            if (auto v = advisor["similarity_threshold"].value<double>()) cfg.advisor.similarity_threshold = static_cast<float>(*v);
            if (auto v = advisor["similarity_limit"].value<int>()) cfg.advisor.similarity_limit = *v;
        }

        if (auto output = tbl["output"]) {
            if (auto v = output["format"].value<std::string>()) cfg.output.format = *v;
            if (auto v = output["color"].value<std::string>()) cfg.output.color = *v;
            if (auto v = output["swatches"].value<bool>()) cfg.output.swatches = *v;
            if (auto v = output["harmonies"].value<bool>()) cfg.output.harmonies = *v;
            if (auto v = output["suggestions"].value<bool>()) cfg.output.suggestions = *v;
            if (auto v = output["gradients"].value<bool>()) cfg.output.gradients = *v;
            if (auto v = output["profile_live"].value<bool>()) cfg.output.profile_live = *v;
        }

        if (!cfg.validate(error)) {
            return std::nullopt;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        std::ostringstream ss;
        ss << "Failed to parse " << path << ": " << e.description();
        error = ss.str();
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    std::string path = default_config_path();
    return load(path);
}

Config merge_config(Config base, const Config& override) {
    Config result = base;
    const Config def = Config::defaults();

    if (override.extraction.color_count != def.extraction.color_count)
        result.extraction.color_count = override.extraction.color_count;
    if (override.extraction.include_transparent)
        result.extraction.include_transparent = true;
    if (override.extraction.max_samples != def.extraction.max_samples)
        result.extraction.max_samples = override.extraction.max_samples;
    if (override.extraction.kmeans_iterations != def.extraction.kmeans_iterations)
        result.extraction.kmeans_iterations = override.extraction.kmeans_iterations;
    if (override.extraction.min_cluster_percentage != def.extraction.min_cluster_percentage)
        result.extraction.min_cluster_percentage = override.extraction.min_cluster_percentage;
    if (override.extraction.dedup_threshold != def.extraction.dedup_threshold)
        result.extraction.dedup_threshold = override.extraction.dedup_threshold;
    if (override.extraction.bucket_factor != def.extraction.bucket_factor)
        result.extraction.bucket_factor = override.extraction.bucket_factor;

    if (override.advisor.max_suggestions != def.advisor.max_suggestions)
        result.advisor.max_suggestions = override.advisor.max_suggestions;
    if (override.advisor.similarity_threshold != def.advisor.similarity_threshold)
        result.advisor.similarity_threshold = override.advisor.similarity_threshold;
    if (override.advisor.similarity_limit != def.advisor.similarity_limit)
        result.advisor.similarity_limit = override.advisor.similarity_limit;

    if (!override.output.format.empty() && override.output.format != def.output.format)
        result.output.format = override.output.format;
    if (!override.output.color.empty() && override.output.color != def.output.color)
        result.output.color = override.output.color;
    if (!override.output.swatches) result.output.swatches = false;
    if (override.output.harmonies) result.output.harmonies = true;
    if (override.output.suggestions) result.output.suggestions = true;
    if (override.output.gradients) result.output.gradients = true;
    if (override.output.profile_live) result.output.profile_live = true;

    if (!override.config_path.empty()) result.config_path = override.config_path;

    return result;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.config_path.empty()) config.config_path = args.config_path;
    if (args.colors > 0) config.extraction.color_count = args.colors;
    if (args.include_transparent) config.extraction.include_transparent = true;

    if (!args.format.empty()) config.output.format = args.format;
    if (!args.color_mode.empty()) config.output.color = args.color_mode;
    if (args.no_swatch) config.output.swatches = false;
    if (args.harmony) config.output.harmonies = true;
    if (args.suggest) config.output.suggestions = true;
    if (args.gradients) config.output.gradients = true;
    if (args.profile_live) config.output.profile_live = true;

    return config;
}

}
