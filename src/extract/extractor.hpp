#pragma once

#include "core/types.hpp"
#include "extract/pixel_sampler.hpp"
#include "extract/kmeans.hpp"
#include "extract/cluster_dedup.hpp"
#include <vector>

namespace chroma {

struct ExtractionResult {
    std::vector<Color> colors;
    Color dominant_color;
    double processing_time_ms = 0.0;
};

struct ExtractionOptions {
    int color_count = 6;
    bool include_transparent = false;
};

// Per-stage wall time of the last extract() call.
struct ExtractionStats {
    double sample_ms = 0.0;
    double median_cut_ms = 0.0;
    double kmeans_ms = 0.0;
    double dedup_ms = 0.0;
    double total_ms = 0.0;
    size_t samples = 0;
    size_t buckets = 0;
    size_t clusters = 0;
};

class ColorExtractor {
public:
    static constexpr int kMinColors = 1;
    static constexpr int kMaxColors = 64;

    struct Config {
        int color_count = 6;
        bool include_transparent = false;
        int max_samples = 40000;
        int kmeans_iterations = 8;
        float min_cluster_percentage = 0.5f;
        float dedup_threshold = 10.0f;
        // Median-cut recursion depth is color_count * bucket_factor.
        int bucket_factor = 2;
    };

    ColorExtractor() : ColorExtractor(Config{}) {}
    explicit ColorExtractor(const Config& config);

    void set_config(const Config& config);
    const Config& config() const { return config_; }

    // EMPTY_IMAGE when no pixel survives sampling. On failure `out` is untouched.
    Result extract(const PixelBuffer& image, ExtractionResult& out);
    Result extract(const uint8_t* rgba, int width, int height, ExtractionResult& out);

    const ExtractionStats& last_stats() const { return stats_; }

private:
    Config config_;
    PixelSampler sampler_;
    KMeans kmeans_;
    ClusterDeduplicator dedup_;
    ExtractionStats stats_;

    Color to_color(const ColorCluster& cluster) const;
};

// Validates the buffer (non-null, at least width * height * 4 bytes, no
// negative dimension) and runs a ColorExtractor with default tuning.
Result extract_colors(const uint8_t* rgba, size_t byte_size, int width, int height,
                      const ExtractionOptions& options, ExtractionResult& out);

}
