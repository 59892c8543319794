#include "extract/extractor.hpp"
#include "extract/median_cut.hpp"
#include "core/color_space.hpp"
#include "naming/color_namer.hpp"
#include <algorithm>
#include <chrono>
#include <climits>
#include <cmath>

namespace chroma {

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

PixelSampler::Config sampler_config(const ColorExtractor::Config& c) {
    PixelSampler::Config s;
    s.max_samples = c.max_samples;
    s.include_transparent = c.include_transparent;
    return s;
}

}

ColorExtractor::ColorExtractor(const Config& config) {
    set_config(config);
}

void ColorExtractor::set_config(const Config& config) {
    config_ = config;
    config_.color_count = std::clamp(config_.color_count, kMinColors, kMaxColors);
    config_.bucket_factor = std::max(1, config_.bucket_factor);
    config_.kmeans_iterations = std::max(0, config_.kmeans_iterations);

    sampler_.set_config(sampler_config(config_));
    kmeans_.set_config({config_.kmeans_iterations});
    dedup_.set_config({config_.min_cluster_percentage, config_.dedup_threshold});
}

Color ColorExtractor::to_color(const ColorCluster& cluster) const {
    Color color = make_color(cluster.centroid, color_name(cluster.centroid));
    color.percentage = std::round(cluster.weight * 10.0f) / 10.0f;
    return color;
}

Result ColorExtractor::extract(const PixelBuffer& image, ExtractionResult& out) {
    return extract(image.data(), image.width(), image.height(), out);
}

Result ColorExtractor::extract(const uint8_t* rgba, int width, int height, ExtractionResult& out) {
    stats_ = ExtractionStats{};
    const auto start = Clock::now();

    auto stage = Clock::now();
    std::vector<RGB> samples = sampler_.sample(rgba, width, height);
    stats_.sample_ms = elapsed_ms(stage);
    stats_.samples = samples.size();

    if (samples.empty()) {
        return Result::fail(ErrorCode::EMPTY_IMAGE, "No pixels to sample");
    }

    stage = Clock::now();
    // Recursion depth, not a leaf count. Splitting stops at single-color buckets.
    const int depth = std::min(config_.color_count * config_.bucket_factor,
                               static_cast<int>(std::min<size_t>(samples.size(), INT_MAX)));
    std::vector<ColorBucket> buckets = MedianCut::partition(samples, depth);
    std::vector<RGB> seeds;
    seeds.reserve(buckets.size());
    for (const auto& bucket : buckets) {
        seeds.push_back(MedianCut::centroid(bucket.colors));
    }
    stats_.median_cut_ms = elapsed_ms(stage);
    stats_.buckets = buckets.size();

    stage = Clock::now();
    std::vector<ColorCluster> clusters = kmeans_.refine(samples, seeds);
    const float total = static_cast<float>(samples.size());
    for (auto& cluster : clusters) {
        cluster.weight = cluster.members.size() / total * 100.0f;
    }
    stats_.kmeans_ms = elapsed_ms(stage);

    stage = Clock::now();
    clusters = dedup_.run(std::move(clusters));
    // A merge can lift a later cluster above an earlier one.
    std::stable_sort(clusters.begin(), clusters.end(),
                     [](const ColorCluster& a, const ColorCluster& b) { return a.weight > b.weight; });
    if (clusters.size() > static_cast<size_t>(config_.color_count)) {
        clusters.resize(config_.color_count);
    }
    stats_.dedup_ms = elapsed_ms(stage);
    stats_.clusters = clusters.size();

    if (clusters.empty()) {
        return Result::fail(ErrorCode::EMPTY_IMAGE, "No color cluster above the minimum share");
    }

    ExtractionResult result;
    result.colors.reserve(clusters.size());
    for (const auto& cluster : clusters) {
        result.colors.push_back(to_color(cluster));
    }
    result.dominant_color = result.colors.at(0);

    stats_.total_ms = elapsed_ms(start);
    result.processing_time_ms = stats_.total_ms;
    out = std::move(result);
    return Result::ok();
}

Result extract_colors(const uint8_t* rgba, size_t byte_size, int width, int height,
                      const ExtractionOptions& options, ExtractionResult& out) {
    if (width < 0 || height < 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Negative image dimensions");
    }
    const size_t needed = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    if (needed > 0 && rgba == nullptr) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Null pixel buffer");
    }
    if (byte_size < needed) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            "Pixel buffer holds " + std::to_string(byte_size) +
                            " bytes, expected " + std::to_string(needed));
    }

    ColorExtractor::Config config;
    config.color_count = options.color_count;
    config.include_transparent = options.include_transparent;
    ColorExtractor extractor(config);
    return extractor.extract(rgba, width, height, out);
}

}
