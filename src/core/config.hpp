#pragma once

#include <cstdint>
#include <cstddef>

namespace progression {

// Display width used when neither an explicit width nor a terminal width
// is available.
inline constexpr uint64_t DEFAULT_WIDTH = 80;

// Columns taken by the fixed line template, excluding prefix, unit and the
// two numeric columns:
//   ' ' HH:MM:SS ' ' ' / ' ' ' open <boundary> close ' ' NNN% ' ETA ' HH:MM:SS
inline constexpr uint64_t LINE_OVERHEAD = 35;

// Minimum interval between two throttled redraws.
inline constexpr uint64_t DEFAULT_THROTTLE_MS = 10;

// Hours above this value render as CLOCK_SENTINEL.
inline constexpr uint64_t CLOCK_MAX_HOURS = 99;
inline constexpr const char* CLOCK_SENTINEL = "??:??:??";

} // namespace progression
