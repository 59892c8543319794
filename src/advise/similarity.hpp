#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace chroma {

// Mean over `a` of each color's best match in `b`, where a match scores
// max(0, 100 - deltaE). Directional: best_similarity(a, b) and
// best_similarity(b, a) generally differ. 0 if either side is empty.
float best_similarity(const std::vector<Color>& a, const std::vector<Color>& b);

struct CandidatePalette {
    std::string id;
    std::string name;
    std::vector<Color> colors;
};

struct SimilarityResult {
    CandidatePalette palette;
    float similarity = 0.0f;
};

// Scores every non-empty candidate against `colors`, keeps those strictly
// above min_similarity and returns the best `limit`, highest first.
std::vector<SimilarityResult> rank_similar_palettes(const std::vector<Color>& colors,
                                                    const std::vector<CandidatePalette>& candidates,
                                                    float min_similarity = 30.0f,
                                                    int limit = 10);

}
