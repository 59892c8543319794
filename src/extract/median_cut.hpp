#pragma once

#include "core/types.hpp"
#include <vector>

namespace chroma {

struct ColorBucket {
    std::vector<RGB> colors;
    RGB min{255, 255, 255};
    RGB max{0, 0, 0};

    int range_r() const { return max.r - min.r; }
    int range_g() const { return max.g - min.g; }
    int range_b() const { return max.b - min.b; }
};

enum class Channel { R, G, B };

class MedianCut {
public:
    // Splits along the widest channel at the median until depth runs out or a
    // bucket holds fewer than two colors, so there are at most
    // min(2^depth, colors.size()) leaves. Leaves come back in left-to-right order.
    static std::vector<ColorBucket> partition(const std::vector<RGB>& colors, int depth);

    static ColorBucket make_bucket(std::vector<RGB> colors);
    static Channel widest_channel(const ColorBucket& bucket);

    // Channel-wise mean rounded to nearest; black for an empty set.
    static RGB centroid(const std::vector<RGB>& colors);

private:
    static void split(std::vector<RGB> colors, int depth, std::vector<ColorBucket>& out);
};

}
