#include "extract/median_cut.hpp"
#include <algorithm>
#include <cmath>

namespace chroma {

ColorBucket MedianCut::make_bucket(std::vector<RGB> colors) {
    ColorBucket bucket;
    for (const auto& c : colors) {
        bucket.min.r = std::min(bucket.min.r, c.r);
        bucket.min.g = std::min(bucket.min.g, c.g);
        bucket.min.b = std::min(bucket.min.b, c.b);
        bucket.max.r = std::max(bucket.max.r, c.r);
        bucket.max.g = std::max(bucket.max.g, c.g);
        bucket.max.b = std::max(bucket.max.b, c.b);
    }
    bucket.colors = std::move(colors);
    return bucket;
}

Channel MedianCut::widest_channel(const ColorBucket& bucket) {
    Channel channel = Channel::R;
    int widest = bucket.range_r();
    if (bucket.range_g() > widest) {
        channel = Channel::G;
        widest = bucket.range_g();
    }
    if (bucket.range_b() > widest) {
        channel = Channel::B;
    }
    return channel;
}

RGB MedianCut::centroid(const std::vector<RGB>& colors) {
    if (colors.empty()) return {0, 0, 0};

    long long sum_r = 0, sum_g = 0, sum_b = 0;
    for (const auto& c : colors) {
        sum_r += c.r;
        sum_g += c.g;
        sum_b += c.b;
    }
    const double n = static_cast<double>(colors.size());
    return {static_cast<int>(std::lround(sum_r / n)),
            static_cast<int>(std::lround(sum_g / n)),
            static_cast<int>(std::lround(sum_b / n))};
}

std::vector<ColorBucket> MedianCut::partition(const std::vector<RGB>& colors, int depth) {
    std::vector<ColorBucket> buckets;
    if (colors.empty()) return buckets;
    split(colors, std::max(0, depth), buckets);
    return buckets;
}

void MedianCut::split(std::vector<RGB> colors, int depth, std::vector<ColorBucket>& out) {
    if (depth == 0 || colors.size() < 2) {
        out.push_back(make_bucket(std::move(colors)));
        return;
    }

    ColorBucket bucket = make_bucket(std::move(colors));
    const Channel channel = widest_channel(bucket);

    auto key = [channel](const RGB& c) {
        switch (channel) {
            case Channel::R: return c.r;
            case Channel::G: return c.g;
            case Channel::B: return c.b;
        }
        return c.r;
    };
    std::stable_sort(bucket.colors.begin(), bucket.colors.end(),
                     [&key](const RGB& a, const RGB& b) { return key(a) < key(b); });

    const auto mid = static_cast<std::ptrdiff_t>(bucket.colors.size() / 2);
    std::vector<RGB> left(bucket.colors.begin(), bucket.colors.begin() + mid);
    std::vector<RGB> right(bucket.colors.begin() + mid, bucket.colors.end());
    bucket.colors.clear();
    bucket.colors.shrink_to_fit();

    split(std::move(left), depth - 1, out);
    split(std::move(right), depth - 1, out);
}

}
