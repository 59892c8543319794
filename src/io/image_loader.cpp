#include "io/image_loader.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <filesystem>
#include <vector>

#ifdef CHROMA_USE_OPENCV
#include <opencv2/opencv.hpp>
#else
#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_THREAD_LOCAL
#include "stb_image.h"
#endif

namespace chroma {

namespace {

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

#ifdef CHROMA_USE_OPENCV
Result convert_mat(const cv::Mat& mat, PixelBuffer& out) {
    if (mat.empty()) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "Could not decode image");
    }

    cv::Mat rgba;
    if (mat.channels() == 3) {
        cv::cvtColor(mat, rgba, cv::COLOR_BGR2RGBA);
    } else if (mat.channels() == 4) {
        cv::cvtColor(mat, rgba, cv::COLOR_BGRA2RGBA);
    } else if (mat.channels() == 1) {
        cv::cvtColor(mat, rgba, cv::COLOR_GRAY2RGBA);
    } else {
        return Result::fail(ErrorCode::INVALID_FORMAT,
                            "Unsupported channel count: " + std::to_string(mat.channels()));
    }
    if (rgba.depth() != CV_8U) {
        rgba.convertTo(rgba, CV_8U, 1.0 / 257.0);
    }

    PixelBuffer buffer(rgba.cols, rgba.rows);
    for (int y = 0; y < rgba.rows; ++y) {
        const uint8_t* row = rgba.ptr<uint8_t>(y);
        std::copy(row, row + static_cast<size_t>(rgba.cols) * 4,
                  buffer.data() + static_cast<size_t>(y) * rgba.cols * 4);
    }
    out = std::move(buffer);
    return Result::ok();
}
#else
Result adopt_stb(unsigned char* data, int w, int h, PixelBuffer& out) {
    if (!data) {
        const char* reason = stbi_failure_reason();
        return Result::fail(ErrorCode::INVALID_FORMAT,
                            std::string("Could not decode image: ") + (reason ? reason : "unknown"));
    }
    if (w <= 0 || h <= 0) {
        stbi_image_free(data);
        return Result::fail(ErrorCode::INVALID_FORMAT, "Image has no pixels");
    }

    out = PixelBuffer::from_rgba(data, w, h);
    stbi_image_free(data);
    return Result::ok();
}
#endif

}

bool ImageLoader::is_safe_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find("..") != std::string::npos) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

bool ImageLoader::is_supported_extension(const std::string& path) {
    std::string lower = to_lower_copy(path);
    return lower.ends_with(".png") || lower.ends_with(".jpg") ||
           lower.ends_with(".jpeg") || lower.ends_with(".bmp") ||
           lower.ends_with(".gif") || lower.ends_with(".tga") ||
           lower.ends_with(".psd") || lower.ends_with(".pnm") ||
           lower.ends_with(".ppm") || lower.ends_with(".pgm") ||
           lower.ends_with(".hdr");
}

Result ImageLoader::load(const std::string& path, PixelBuffer& out) {
    if (!is_safe_path(path)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Rejected image path: " + path);
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(std::filesystem::path(path), ec) || ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Cannot open image: " + path);
    }

#ifdef CHROMA_USE_OPENCV
    Result r = convert_mat(cv::imread(path, cv::IMREAD_UNCHANGED), out);
#else
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);
    Result r = adopt_stb(data, w, h, out);
#endif
    if (r.failure()) {
        r.message += " (" + path + ")";
    }
    return r;
}

Result ImageLoader::load_from_memory(const uint8_t* data, size_t size, PixelBuffer& out) {
    if (data == nullptr || size == 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Empty image data");
    }

#ifdef CHROMA_USE_OPENCV
    std::vector<uint8_t> bytes(data, data + size);
    return convert_mat(cv::imdecode(bytes, cv::IMREAD_UNCHANGED), out);
#else
    if (size > static_cast<size_t>(INT_MAX)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Image data too large");
    }
    int w = 0, h = 0, channels = 0;
    unsigned char* pixels = stbi_load_from_memory(data, static_cast<int>(size), &w, &h, &channels, 4);
    return adopt_stb(pixels, w, h, out);
#endif
}

}
