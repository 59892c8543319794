#pragma once

#include "core/types.hpp"
#include "extract/extractor.hpp"
#include <string>
#include <optional>

namespace chroma {

constexpr int CONFIG_VERSION = 1;

struct ConfigExtraction {
    int color_count = 6;
    bool include_transparent = false;
    int max_samples = 40000;
    int kmeans_iterations = 8;
    float min_cluster_percentage = 0.5f;
    float dedup_threshold = 10.0f;
    int bucket_factor = 2;
};

struct ConfigAdvisor {
    int max_suggestions = 6;
    float similarity_threshold = 30.0f;
    int similarity_limit = 10;
};

struct ConfigOutput {
    std::string format = "text";
    std::string color = "auto";
    bool swatches = true;
    bool harmonies = false;
    bool suggestions = false;
    bool gradients = false;
    bool profile_live = false;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigExtraction extraction;
    ConfigAdvisor advisor;
    ConfigOutput output;

    std::string config_path;

    bool validate(std::string& error) const;
    ColorExtractor::Config extractor_config() const;

    static Config defaults();
    static std::optional<Config> load(const std::string& path);
    static std::optional<Config> load(const std::string& path, std::string& error);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config merge_config(Config base, const Config& override);
Config apply_cli_overrides(Config config, const struct Args& args);

}
