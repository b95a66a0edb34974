#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace progression {

// Strategy turning a counter value into its display form.
// The returned string must be ASCII so its length equals its column count.
using NumberFormat = std::function<std::string(uint64_t)>;

// Plain decimal: 1234567 -> "1234567"
std::string format_plain(uint64_t value);

// Decimal grouped by thousands: 1234567 -> "1,234,567"
std::string format_grouped(uint64_t value, char separator = ',');

// Number of code points in a UTF-8 string (display columns for the
// single-width glyphs a bar is drawn with).
size_t utf8_length(const std::string& s);

} // namespace progression
