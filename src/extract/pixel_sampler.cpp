#include "extract/pixel_sampler.hpp"
#include <algorithm>
#include <cmath>

namespace chroma {

PixelSampler::PixelSampler(const Config& config) : config_(config) {}

int PixelSampler::step_for(int width, int height) const {
    if (width <= 0 || height <= 0) return 1;
    const double total = static_cast<double>(width) * height;
    const double budget = static_cast<double>(std::max(1, config_.max_samples));
    return std::max(1, static_cast<int>(std::floor(std::sqrt(total / budget))));
}

std::vector<RGB> PixelSampler::sample(const uint8_t* rgba, int width, int height) const {
    std::vector<RGB> colors;
    if (rgba == nullptr || width <= 0 || height <= 0) return colors;

    const int step = step_for(width, height);
    const size_t cols = static_cast<size_t>((width + step - 1) / step);
    const size_t rows = static_cast<size_t>((height + step - 1) / step);
    colors.reserve(cols * rows);

    for (int y = 0; y < height; y += step) {
        const uint8_t* row = rgba + static_cast<size_t>(y) * width * 4;
        for (int x = 0; x < width; x += step) {
            const uint8_t* px = row + static_cast<size_t>(x) * 4;
            if (!config_.include_transparent && px[3] < config_.alpha_cutoff) {
                continue;
            }
            colors.emplace_back(px[0], px[1], px[2]);
        }
    }

    return colors;
}

std::vector<RGB> PixelSampler::sample(const PixelBuffer& buffer) const {
    return sample(buffer.data(), buffer.width(), buffer.height());
}

}
