#pragma once

#include "core/types.hpp"
#include <vector>
#include <cstdint>

namespace chroma {

class PixelSampler {
public:
    struct Config {
        int max_samples = 40000;
        bool include_transparent = false;
        uint8_t alpha_cutoff = 128;
    };

    PixelSampler() : PixelSampler(Config{}) {}
    explicit PixelSampler(const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    // Visits a step x step grid so the sample count stays near max_samples
    // whatever the resolution. Pixels with alpha below the cutoff are skipped
    // unless include_transparent is set. An empty result is not an error here.
    std::vector<RGB> sample(const uint8_t* rgba, int width, int height) const;
    std::vector<RGB> sample(const PixelBuffer& buffer) const;

    int step_for(int width, int height) const;

private:
    Config config_;
};

}
