#include "extract/kmeans.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace chroma {

KMeans::KMeans(const Config& config) : config_(config) {}

int KMeans::distance_sq(const RGB& a, const RGB& b) {
    int dr = a.r - b.r;
    int dg = a.g - b.g;
    int db = a.b - b.b;
    return dr * dr + dg * dg + db * db;
}

size_t KMeans::nearest(const RGB& color, const std::vector<RGB>& centroids) {
    size_t best = 0;
    int best_dist = std::numeric_limits<int>::max();
    for (size_t k = 0; k < centroids.size(); ++k) {
        int dist = distance_sq(color, centroids[k]);
        if (dist < best_dist) {
            best_dist = dist;
            best = k;
        }
    }
    return best;
}

std::vector<size_t> KMeans::assign(const std::vector<RGB>& samples,
                                   const std::vector<RGB>& centroids) {
    std::vector<size_t> assignment(samples.size(), 0);
    for (size_t i = 0; i < samples.size(); ++i) {
        assignment[i] = nearest(samples[i], centroids);
    }
    return assignment;
}

std::vector<RGB> KMeans::step(const std::vector<RGB>& samples,
                              const std::vector<RGB>& centroids) {
    const size_t k = centroids.size();
    const std::vector<size_t> assignment = assign(samples, centroids);

    std::vector<long long> sum_r(k, 0), sum_g(k, 0), sum_b(k, 0);
    std::vector<size_t> count(k, 0);
    for (size_t i = 0; i < samples.size(); ++i) {
        size_t c = assignment[i];
        sum_r[c] += samples[i].r;
        sum_g[c] += samples[i].g;
        sum_b[c] += samples[i].b;
        count[c]++;
    }

    std::vector<RGB> next(centroids);
    for (size_t c = 0; c < k; ++c) {
        if (count[c] == 0) continue;
        const double n = static_cast<double>(count[c]);
        next[c] = {static_cast<int>(std::lround(sum_r[c] / n)),
                   static_cast<int>(std::lround(sum_g[c] / n)),
                   static_cast<int>(std::lround(sum_b[c] / n))};
    }
    return next;
}

std::vector<ColorCluster> KMeans::refine(const std::vector<RGB>& samples,
                                         const std::vector<RGB>& initial_centroids) const {
    std::vector<ColorCluster> clusters;
    if (samples.empty() || initial_centroids.empty()) return clusters;

    std::vector<RGB> centroids = initial_centroids;
    for (int it = 0; it < config_.iterations; ++it) {
        std::vector<RGB> next = step(samples, centroids);
        if (next == centroids) break;
        centroids = std::move(next);
    }

    clusters.resize(centroids.size());
    for (size_t c = 0; c < centroids.size(); ++c) {
        clusters[c].centroid = centroids[c];
    }

    const std::vector<size_t> assignment = assign(samples, centroids);
    for (size_t i = 0; i < samples.size(); ++i) {
        clusters[assignment[i]].members.push_back(samples[i]);
    }

    clusters.erase(std::remove_if(clusters.begin(), clusters.end(),
                                  [](const ColorCluster& c) { return c.members.empty(); }),
                   clusters.end());
    return clusters;
}

}
