#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace progression {

// "HH:MM:SS", zero-padded; "??:??:??" once hours exceed 99.
std::string format_clock(uint64_t seconds);

// Seconds remaining, extrapolated from the average time per unit so far:
// ceil((total - position) * elapsed_secs / position).
// std::nullopt while nothing has been counted (position == 0 < total).
std::optional<uint64_t> estimate_eta(uint64_t position, uint64_t total,
                                     double elapsed_secs);

} // namespace progression
