#include "terminal/terminal.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string_view>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace chroma {

namespace {

// VGA-style base colors; 8..15 are the bright variants.
const RGB kAnsiBase[16] = {
    {0, 0, 0}, {128, 0, 0}, {0, 128, 0}, {128, 128, 0},
    {0, 0, 128}, {128, 0, 128}, {0, 128, 128}, {192, 192, 192},
    {128, 128, 128}, {255, 0, 0}, {0, 255, 0}, {255, 255, 0},
    {0, 0, 255}, {255, 0, 255}, {0, 255, 255}, {255, 255, 255}
};

constexpr int kCubeLevels[6] = {0, 95, 135, 175, 215, 255};

int dist2(int r, int g, int b, const RGB& c) {
    const int dr = r - c.r;
    const int dg = g - c.g;
    const int db = b - c.b;
    return dr * dr + dg * dg + db * db;
}

int nearest_cube_level(int v) {
    int best = 0;
    for (int i = 1; i < 6; ++i) {
        if (std::abs(v - kCubeLevels[i]) < std::abs(v - kCubeLevels[best])) best = i;
    }
    return best;
}

int nearest_gray_step(int r, int g, int b) {
    const int avg = (r + g + b) / 3;
    if (avg <= 8) return 0;
    if (avg >= 238) return 23;
    return std::min(23, (avg - 8 + 5) / 10);
}

std::string sgr(std::string_view params) {
    std::string s = "\033[";
    s += params;
    s += 'm';
    return s;
}

}

std::optional<ColorMode> parse_color_mode(const std::string& s) {
    if (s == "none") return ColorMode::None;
    if (s == "16") return ColorMode::Ansi16;
    if (s == "256") return ColorMode::Ansi256;
    if (s == "truecolor") return ColorMode::Truecolor;
    return std::nullopt;
}

const char* color_mode_name(ColorMode mode) {
    switch (mode) {
        case ColorMode::None: return "none";
        case ColorMode::Ansi16: return "16";
        case ColorMode::Ansi256: return "256";
        case ColorMode::Truecolor: return "truecolor";
    }
    return "none";
}

Terminal::Terminal() : info_(get_info()) {}

TerminalInfo Terminal::get_info() const {
    TerminalInfo info;
#ifdef _WIN32
    info.is_tty = _isatty(_fileno(stdout)) != 0;
#else
    info.is_tty = isatty(STDOUT_FILENO) != 0;
#endif

    // Piped output gets plain text.
    info.color_mode = info.is_tty ? detect_color_mode() : ColorMode::None;
    return info;
}

ColorMode Terminal::detect_color_mode() {
    const char* no_color = std::getenv("NO_COLOR");
    if (no_color && *no_color) return ColorMode::None;

    const std::string_view colorterm = std::getenv("COLORTERM") ? std::getenv("COLORTERM") : "";
    if (colorterm == "truecolor" || colorterm == "24bit") return ColorMode::Truecolor;

    const std::string_view term = std::getenv("TERM") ? std::getenv("TERM") : "";
    if (term == "dumb") return ColorMode::None;
    if (term.find("256color") != std::string_view::npos) return ColorMode::Ansi256;

    return ColorMode::Ansi16;
}

std::string Terminal::color_code(ColorMode mode, uint8_t r, uint8_t g, uint8_t b, bool fg) {
    switch (mode) {
        case ColorMode::None:
            return "";
        case ColorMode::Ansi16: {
            const int idx = rgb_to_16(r, g, b);
            const int base = fg ? (idx < 8 ? 30 : 90) : (idx < 8 ? 40 : 100);
            return sgr(std::to_string(base + (idx & 7)));
        }
        case ColorMode::Ansi256:
            return sgr(std::string(fg ? "38;5;" : "48;5;") + std::to_string(rgb_to_256(r, g, b)));
        case ColorMode::Truecolor:
            return sgr(std::string(fg ? "38;2;" : "48;2;") + std::to_string(r) + ';' +
                       std::to_string(g) + ';' + std::to_string(b));
    }
    return "";
}

std::string Terminal::color_code(ColorMode mode, const RGB& rgb, bool fg) {
    const RGB c = RGB::clamped(rgb.r, rgb.g, rgb.b);
    return color_code(mode, static_cast<uint8_t>(c.r), static_cast<uint8_t>(c.g),
                      static_cast<uint8_t>(c.b), fg);
}

std::string Terminal::reset_code(ColorMode mode) {
    return mode == ColorMode::None ? "" : sgr("0");
}

// Candidates are the base 16, the nearest cube cell and the nearest gray step.
// On equal distance the lower index wins.
uint8_t Terminal::rgb_to_256(uint8_t r, uint8_t g, uint8_t b) {
    int best_idx = rgb_to_16(r, g, b);
    int best_dist = dist2(r, g, b, kAnsiBase[best_idx]);

    const int cr = nearest_cube_level(r);
    const int cg = nearest_cube_level(g);
    const int cb = nearest_cube_level(b);
    const int cube_idx = 16 + 36 * cr + 6 * cg + cb;
    const int cube_dist = dist2(r, g, b, RGB(kCubeLevels[cr], kCubeLevels[cg], kCubeLevels[cb]));
    if (cube_dist < best_dist) {
        best_idx = cube_idx;
        best_dist = cube_dist;
    }

    const int step = nearest_gray_step(r, g, b);
    const int gray = 8 + step * 10;
    const int gray_dist = dist2(r, g, b, RGB(gray, gray, gray));
    if (gray_dist < best_dist) {
        best_idx = 232 + step;
    }

    return static_cast<uint8_t>(best_idx);
}

uint8_t Terminal::rgb_to_16(uint8_t r, uint8_t g, uint8_t b) {
    int best_idx = 0;
    int best_dist = dist2(r, g, b, kAnsiBase[0]);
    for (int i = 1; i < 16; ++i) {
        const int d = dist2(r, g, b, kAnsiBase[i]);
        if (d < best_dist) {
            best_dist = d;
            best_idx = i;
        }
    }
    return static_cast<uint8_t>(best_idx);
}

}
