#include "util/terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

namespace progression {

std::optional<uint64_t> terminal_width(int fd) {
    if (fd < 0 || !::isatty(fd)) return std::nullopt;

    struct winsize ws;
    if (::ioctl(fd, TIOCGWINSZ, &ws) == -1) return std::nullopt;
    if (ws.ws_col == 0) return std::nullopt;
    return static_cast<uint64_t>(ws.ws_col);
}

std::optional<uint64_t> stderr_terminal_width() {
    return terminal_width(STDERR_FILENO);
}

bool is_terminal(std::FILE* stream) {
    if (!stream) return false;
    int fd = ::fileno(stream);
    return fd >= 0 && ::isatty(fd);
}

} // namespace progression
