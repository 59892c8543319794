#include "render/swatch_renderer.hpp"
#include "core/color_space.hpp"
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <system_error>

namespace chroma {

SwatchRenderer::SwatchRenderer(const Config& config) : config_(config) {}

void SwatchRenderer::append(const std::string& s) {
    out_ += s;
}

void SwatchRenderer::append_number(int v) {
    char tmp[16];
    auto res = std::to_chars(tmp, tmp + sizeof(tmp), v);
    if (res.ec == std::errc()) {
        out_.append(tmp, res.ptr);
    } else {
        out_ += '0';
    }
}

void SwatchRenderer::append_number(double v, int precision) {
    char tmp[64];
    int n = std::snprintf(tmp, sizeof(tmp), "%.*f", precision, v);
    if (n > 0 && n < static_cast<int>(sizeof(tmp))) {
        out_.append(tmp, static_cast<size_t>(n));
    } else {
        out_ += '0';
    }
}

void SwatchRenderer::append_swatch(const Color& color, const std::string& label) {
    const ColorMode mode = config_.color_mode;
    if (!config_.swatches) return;

    if (mode == ColorMode::None) {
        append("[");
        append(label);
        append("] ");
        return;
    }

    std::string cell = label;
    const size_t width = static_cast<size_t>(std::max(config_.swatch_width, static_cast<int>(label.size()) + 2));
    size_t pad = width - cell.size();
    cell = std::string(pad / 2, ' ') + cell + std::string(pad - pad / 2, ' ');

    append(Terminal::color_code(mode, color.rgb, false));
    append(Terminal::color_code(mode, ColorSpace::text_color(color.rgb), true));
    append(cell);
    append(Terminal::reset_code(mode));
    append(" ");
}

void SwatchRenderer::append_color_row(const Color& color) {
    append(color.hex);
    append("  rgb(");
    append_number(color.rgb.r);
    append(", ");
    append_number(color.rgb.g);
    append(", ");
    append_number(color.rgb.b);
    append(")  hsl(");
    append_number(color.hsl.h);
    append(", ");
    append_number(color.hsl.s);
    append("%, ");
    append_number(color.hsl.l);
    append("%)");
    if (color.name) {
        append("  ");
        append(*color.name);
    }
}

std::string SwatchRenderer::render_color_line(const Color& color) {
    out_.clear();
    append_swatch(color, "  ");
    append_color_row(color);
    append("\n");
    return out_;
}

std::string SwatchRenderer::render_text(const PaletteReport& report) {
    out_.clear();
    const ExtractionResult& result = report.result;

    if (!report.source.empty()) {
        append(report.source);
        append("\n");
    }
    append("Palette (");
    append_number(static_cast<int>(result.colors.size()));
    append(" colors, ");
    append_number(result.processing_time_ms, 1);
    append(" ms)\n");

    for (const auto& color : result.colors) {
        std::string pct;
        if (color.percentage) {
            char tmp[16];
            std::snprintf(tmp, sizeof(tmp), "%5.1f%%", *color.percentage);
            pct = tmp;
        }
        append("  ");
        append_swatch(color, pct.empty() ? "  " : pct);
        if (!config_.swatches && !pct.empty()) {
            append(pct);
            append("  ");
        }
        append_color_row(color);
        append("\n");
    }

    if (!report.harmonies.empty()) {
        append("\nHarmonies\n");
        for (const auto& h : report.harmonies) {
            append("  ");
            append(h.name);
            append(": ");
            for (const auto& c : h.colors) {
                append_swatch(c, c.hex);
                if (!config_.swatches) {
                    append(c.hex);
                    append(" ");
                }
            }
            append("\n    ");
            append(h.description);
            append("\n");
        }
    }

    if (!report.suggestions.empty()) {
        append("\nSuggestions\n");
        for (const auto& s : report.suggestions) {
            append("  ");
            append_swatch(s.color, "  ");
            append(s.color.hex);
            append("  ");
            append(s.name);
            append(" - ");
            append(s.reason);
            append("\n");
        }
    }

    if (!report.gradients.empty()) {
        append("\nGradients\n");
        for (const auto& g : report.gradients) {
            append("  ");
            append(g.name);
            append("\n    ");
            append(g.css);
            append("\n");
        }
    }

    if (report.similarity) {
        append("\nSimilarity to");
        for (const auto& c : report.compared) {
            append(" ");
            append(c.hex);
        }
        append(": ");
        append_number(*report.similarity, 1);
        append("%\n");
    }

    return out_;
}

std::string SwatchRenderer::json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char tmp[8];
                    std::snprintf(tmp, sizeof(tmp), "\\u%04x", c);
                    out += tmp;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    return out;
}

void SwatchRenderer::append_json_string(const std::string& s) {
    append("\"");
    append(json_escape(s));
    append("\"");
}

void SwatchRenderer::append_json_color(const Color& color) {
    append("{\"hex\":");
    append_json_string(color.hex);
    append(",\"rgb\":{\"r\":");
    append_number(color.rgb.r);
    append(",\"g\":");
    append_number(color.rgb.g);
    append(",\"b\":");
    append_number(color.rgb.b);
    append("},\"hsl\":{\"h\":");
    append_number(color.hsl.h);
    append(",\"s\":");
    append_number(color.hsl.s);
    append(",\"l\":");
    append_number(color.hsl.l);
    append("}");
    if (color.name) {
        append(",\"name\":");
        append_json_string(*color.name);
    }
    if (color.percentage) {
        append(",\"percentage\":");
        append_number(*color.percentage, 1);
    }
    append("}");
}

std::string SwatchRenderer::render_json(const PaletteReport& report) {
    out_.clear();
    const ExtractionResult& result = report.result;

    append("{\"source\":");
    append_json_string(report.source);
    append(",\"processingTimeMs\":");
    append_number(result.processing_time_ms, 3);
    append(",\"colors\":[");
    for (size_t i = 0; i < result.colors.size(); ++i) {
        if (i > 0) append(",");
        append_json_color(result.colors[i]);
    }
    append("]");
    if (!result.colors.empty()) {
        append(",\"dominantColor\":");
        append_json_color(result.dominant_color);
    }

    if (!report.harmonies.empty()) {
        append(",\"harmonies\":[");
        for (size_t i = 0; i < report.harmonies.size(); ++i) {
            const auto& h = report.harmonies[i];
            if (i > 0) append(",");
            append("{\"name\":");
            append_json_string(h.name);
            append(",\"description\":");
            append_json_string(h.description);
            append(",\"colors\":[");
            for (size_t j = 0; j < h.colors.size(); ++j) {
                if (j > 0) append(",");
                append_json_color(h.colors[j]);
            }
            append("]}");
        }
        append("]");
    }

    if (!report.suggestions.empty()) {
        append(",\"suggestions\":[");
        for (size_t i = 0; i < report.suggestions.size(); ++i) {
            const auto& s = report.suggestions[i];
            if (i > 0) append(",");
            append("{\"type\":");
            append_json_string(suggestion_type_name(s.type));
            append(",\"name\":");
            append_json_string(s.name);
            append(",\"color\":");
            append_json_color(s.color);
            append(",\"reason\":");
            append_json_string(s.reason);
            append("}");
        }
        append("]");
    }

    if (!report.gradients.empty()) {
        append(",\"gradients\":[");
        for (size_t i = 0; i < report.gradients.size(); ++i) {
            const auto& g = report.gradients[i];
            if (i > 0) append(",");
            append("{\"name\":");
            append_json_string(g.name);
            append(",\"kind\":");
            append_json_string(gradient_kind_name(g.kind));
            append(",\"css\":");
            append_json_string(g.css);
            append(",\"stops\":[");
            for (size_t j = 0; j < g.stops.size(); ++j) {
                if (j > 0) append(",");
                append("{\"hex\":");
                append_json_string(g.stops[j].color.hex);
                append(",\"position\":");
                append_number(g.stops[j].position, 2);
                append("}");
            }
            append("]}");
        }
        append("]");
    }

    if (report.similarity) {
        append(",\"similarity\":");
        append_number(*report.similarity, 2);
    }

    append("}\n");
    return out_;
}

}
