#include "extract/cluster_dedup.hpp"
#include "core/color_space.hpp"
#include <algorithm>

namespace chroma {

ClusterDeduplicator::ClusterDeduplicator(const Config& config) : config_(config) {}

std::vector<ColorCluster> ClusterDeduplicator::filter_small(std::vector<ColorCluster> clusters) const {
    clusters.erase(std::remove_if(clusters.begin(), clusters.end(),
                                  [this](const ColorCluster& c) { return !(c.weight > config_.min_weight); }),
                   clusters.end());
    std::stable_sort(clusters.begin(), clusters.end(),
                     [](const ColorCluster& a, const ColorCluster& b) { return a.weight > b.weight; });
    return clusters;
}

std::vector<ColorCluster> ClusterDeduplicator::merge_similar(const std::vector<ColorCluster>& sorted) const {
    std::vector<ColorCluster> accepted;

    for (const auto& cluster : sorted) {
        bool merged = false;
        for (auto& existing : accepted) {
            if (ColorSpace::delta_e(cluster.centroid, existing.centroid) < config_.delta_e_threshold) {
                existing.weight += cluster.weight;
                existing.members.insert(existing.members.end(),
                                        cluster.members.begin(), cluster.members.end());
                merged = true;
                break;
            }
        }
        if (!merged) {
            accepted.push_back(cluster);
        }
    }

    return accepted;
}

std::vector<ColorCluster> ClusterDeduplicator::run(std::vector<ColorCluster> clusters) const {
    return merge_similar(filter_small(std::move(clusters)));
}

}
