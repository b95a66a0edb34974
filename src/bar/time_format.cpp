#include "bar/time_format.hpp"
#include "core/config.hpp"

#include <cmath>
#include <cstdio>
#include <limits>

namespace progression {

std::string format_clock(uint64_t seconds) {
    uint64_t hours = seconds / 3600;
    if (hours > CLOCK_MAX_HOURS) return CLOCK_SENTINEL;

    unsigned mins = static_cast<unsigned>((seconds / 60) % 60);
    unsigned secs = static_cast<unsigned>(seconds % 60);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u",
                  static_cast<unsigned>(hours), mins, secs);
    return buf;
}

std::optional<uint64_t> estimate_eta(uint64_t position, uint64_t total,
                                     double elapsed_secs) {
    if (position >= total) return 0;
    if (position == 0) return std::nullopt;

    double secs_per_unit = elapsed_secs / static_cast<double>(position);
    double eta = std::ceil(static_cast<double>(total - position) * secs_per_unit);
    if (!(eta < static_cast<double>(std::numeric_limits<uint64_t>::max()))) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(eta);
}

} // namespace progression
