#pragma once

#include "extract/kmeans.hpp"
#include <vector>

namespace chroma {

class ClusterDeduplicator {
public:
    struct Config {
        float min_weight = 0.5f;
        float delta_e_threshold = 10.0f;
    };

    ClusterDeduplicator() : ClusterDeduplicator(Config{}) {}
    explicit ClusterDeduplicator(const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    // Drops clusters whose weight is not above min_weight, then orders the
    // rest by descending weight. Equal weights keep their input order.
    std::vector<ColorCluster> filter_small(std::vector<ColorCluster> clusters) const;

    // Expects descending weight. A cluster closer than the threshold to an
    // already accepted centroid adds its weight to that centroid and is not
    // emitted; the first accepted centroid stays the representative.
    std::vector<ColorCluster> merge_similar(const std::vector<ColorCluster>& sorted) const;

    std::vector<ColorCluster> run(std::vector<ColorCluster> clusters) const;

private:
    Config config_;
};

}
