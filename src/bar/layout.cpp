#include "bar/layout.hpp"
#include "core/config.hpp"
#include "util/number_format.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace progression {

uint64_t effective_width(const BarConfig& config) {
    if (config.width) return *config.width;
    if (config.width_query) {
        if (auto w = config.width_query()) return *w;
    }
    return config.default_width;
}

uint64_t reserved_columns(const BarConfig& config, size_t num_width) {
    // LINE_OVERHEAD assumes one column per delimiter
    uint64_t cols = LINE_OVERHEAD - 2;
    cols += utf8_length(config.delimiters.first);
    cols += utf8_length(config.delimiters.second);
    cols += utf8_length(config.prefix);
    cols += utf8_length(config.unit);
    cols += static_cast<uint64_t>(num_width) * 2;
    if (!config.unit.empty()) cols += 1; // space before the unit
    return cols;
}

bool resolve_layout(const BarConfig& config, uint64_t total,
                    Layout& layout, std::string& error) {
    // Fill, edge and space are repeated per column and must be one glyph each
    const std::pair<const char*, const std::string*> glyphs[] = {
        {"fill", &config.style.fill},
        {"edge", &config.style.edge},
        {"space", &config.space},
    };
    for (const auto& g : glyphs) {
        if (utf8_length(*g.second) != 1) {
            error = std::string(g.first) + " glyph \"" + *g.second +
                    "\" must be exactly one character";
            return false;
        }
    }

    std::string total_str = config.number_format
        ? config.number_format(total)
        : format_plain(total);

    size_t num_width = std::max(config.num_width, total_str.size());
    uint64_t width = effective_width(config);
    uint64_t reserved = reserved_columns(config, num_width);

    if (width < reserved) {
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "display width %lu is smaller than the %lu columns "
                      "reserved for counters, clocks and text",
                      static_cast<unsigned long>(width),
                      static_cast<unsigned long>(reserved));
        error = buf;
        return false;
    }

    layout.num_width = num_width;
    layout.fill_width = width - reserved;
    return true;
}

} // namespace progression
