#pragma once

#include "bar/bar_config.hpp"

#include <cstdint>
#include <cstddef>
#include <string>

namespace progression {

// Column widths resolved once per bar.
struct Layout {
    size_t num_width = 0;    // width of each right-aligned counter column
    uint64_t fill_width = 0; // glyphs between the delimiters, boundary excluded
};

// Display width a bar built from config should occupy:
// explicit width, else width_query() if it yields a value, else default_width.
uint64_t effective_width(const BarConfig& config);

// Columns used by everything except the fill region.
uint64_t reserved_columns(const BarConfig& config, size_t num_width);

// Resolve the layout of a bar counting up to total.
// Returns false and sets error if the reserved columns do not fit
// in the effective width.
bool resolve_layout(const BarConfig& config, uint64_t total,
                    Layout& layout, std::string& error);

} // namespace progression
