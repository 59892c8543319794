#pragma once

#include "core/types.hpp"
#include <vector>

namespace chroma {

struct ColorCluster {
    RGB centroid;
    std::vector<RGB> members;
    // Share of all sampled pixels, in percent. Filled in by the extractor.
    float weight = 0.0f;
};

class KMeans {
public:
    struct Config {
        int iterations = 8;
    };

    KMeans() : KMeans(Config{}) {}
    explicit KMeans(const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    // Each iteration maps one centroid snapshot to the next; nothing is
    // shared between iterations. Returns only clusters that own samples, in
    // centroid order.
    std::vector<ColorCluster> refine(const std::vector<RGB>& samples,
                                     const std::vector<RGB>& initial_centroids) const;

    static std::vector<RGB> step(const std::vector<RGB>& samples,
                                 const std::vector<RGB>& centroids);

    // Index of the closest centroid by Euclidean RGB distance; the first one
    // wins on ties.
    static size_t nearest(const RGB& color, const std::vector<RGB>& centroids);

    static int distance_sq(const RGB& a, const RGB& b);

private:
    Config config_;

    static std::vector<size_t> assign(const std::vector<RGB>& samples,
                                      const std::vector<RGB>& centroids);
};

}
