#include "advise/similarity.hpp"
#include "core/color_space.hpp"
#include <algorithm>

namespace chroma {

float best_similarity(const std::vector<Color>& a, const std::vector<Color>& b) {
    if (a.empty() || b.empty()) return 0.0f;

    float total = 0.0f;
    for (const auto& c1 : a) {
        float best = 0.0f;
        for (const auto& c2 : b) {
            float score = std::max(0.0f, 100.0f - ColorSpace::delta_e(c1.rgb, c2.rgb));
            best = std::max(best, score);
        }
        total += best;
    }
    return total / static_cast<float>(a.size());
}

std::vector<SimilarityResult> rank_similar_palettes(const std::vector<Color>& colors,
                                                    const std::vector<CandidatePalette>& candidates,
                                                    float min_similarity,
                                                    int limit) {
    std::vector<SimilarityResult> results;
    for (const auto& candidate : candidates) {
        if (candidate.colors.empty()) continue;
        float score = best_similarity(colors, candidate.colors);
        if (score > min_similarity) {
            results.push_back({candidate, score});
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const SimilarityResult& x, const SimilarityResult& y) {
                         return x.similarity > y.similarity;
                     });

    const size_t keep = static_cast<size_t>(std::max(0, limit));
    if (results.size() > keep) results.resize(keep);
    return results;
}

}
