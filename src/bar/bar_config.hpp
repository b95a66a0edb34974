#pragma once

#include "core/config.hpp"
#include "util/number_format.hpp"

#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace progression {

// Glyphs drawing the filled part of the bar.
// A mono style draws the progress boundary with the fill glyph itself;
// an edged style draws it with a distinct leading-edge glyph.
// Glyphs are single-column UTF-8 characters; delimiters may be longer.
struct Style {
    std::string fill = "#";
    std::string edge = "#";

    static Style mono(const std::string& glyph) { return Style{glyph, glyph}; }
    static Style edged(const std::string& fill, const std::string& edge) {
        return Style{fill, edge};
    }
};

// Optional query of the current display width (e.g. terminal columns).
using WidthQuery = std::function<std::optional<uint64_t>()>;

struct BarConfig {
    std::optional<uint64_t> width;          // explicit display width
    uint64_t default_width = DEFAULT_WIDTH; // used when width and width_query give nothing
    std::pair<std::string, std::string> delimiters{"[", "]"};
    Style style = Style::mono("#");
    std::string space = " ";                // glyph for the unfilled region
    std::string prefix;
    std::string unit;
    size_t num_width = 0;                   // minimum; widened to fit the total
    uint64_t throttle_ms = DEFAULT_THROTTLE_MS;
    NumberFormat number_format = format_plain;
    WidthQuery width_query;                 // empty: no auto-detection

    static BarConfig ascii() {
        BarConfig c;
        c.style = Style::mono("#");
        return c;
    }

    static BarConfig unicode() {
        BarConfig c;
        c.style = Style::mono("█");
        return c;
    }

    static BarConfig cargo() {
        BarConfig c;
        c.style = Style::edged("=", ">");
        return c;
    }
};

} // namespace progression
