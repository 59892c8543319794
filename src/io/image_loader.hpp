#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace chroma {

// Decodes still images to RGBA8. stb_image by default; OpenCV when built
// with CHROMA_USE_OPENCV.
class ImageLoader {
public:
    static Result load(const std::string& path, PixelBuffer& out);
    static Result load_from_memory(const uint8_t* data, size_t size, PixelBuffer& out);

    static bool is_supported_extension(const std::string& path);
    static bool is_safe_path(const std::string& path);
};

}
