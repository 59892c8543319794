#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace chroma {

enum class ColorMode {
    None,
    Ansi16,
    Ansi256,
    Truecolor
};

struct TerminalInfo {
    ColorMode color_mode = ColorMode::Ansi16;
    bool is_tty = false;
};

// "none", "16", "256", "truecolor"; nullopt otherwise. "auto" is resolved by
// the caller through Terminal::detect_color_mode().
std::optional<ColorMode> parse_color_mode(const std::string& s);
const char* color_mode_name(ColorMode mode);

class Terminal {
public:
    Terminal();

    TerminalInfo get_info() const;
    const TerminalInfo& info() const { return info_; }

    // NO_COLOR or TERM=dumb: none. COLORTERM=truecolor|24bit, then TERM
    // containing "256color", else 16 colors.
    static ColorMode detect_color_mode();

    static std::string color_code(ColorMode mode, uint8_t r, uint8_t g, uint8_t b, bool fg);
    static std::string color_code(ColorMode mode, const RGB& rgb, bool fg);
    static std::string reset_code(ColorMode mode);

    static uint8_t rgb_to_256(uint8_t r, uint8_t g, uint8_t b);
    static uint8_t rgb_to_16(uint8_t r, uint8_t g, uint8_t b);

private:
    TerminalInfo info_;
};

}
