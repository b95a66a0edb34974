#include "util/number_format.hpp"

namespace progression {

std::string format_plain(uint64_t value) {
    return std::to_string(value);
}

std::string format_grouped(uint64_t value, char separator) {
    std::string digits = std::to_string(value);
    size_t n = digits.size();
    if (n <= 3) return digits;

    std::string out;
    out.reserve(n + (n - 1) / 3);
    size_t lead = n % 3;
    if (lead == 0) lead = 3;
    out.append(digits, 0, lead);
    for (size_t i = lead; i < n; i += 3) {
        out.push_back(separator);
        out.append(digits, i, 3);
    }
    return out;
}

size_t utf8_length(const std::string& s) {
    size_t len = 0;
    for (unsigned char c : s) {
        // Continuation bytes are 10xxxxxx
        if ((c & 0xC0) != 0x80) len++;
    }
    return len;
}

} // namespace progression
