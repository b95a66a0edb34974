#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>

namespace progression {

// Query the column count of the terminal attached to fd.
// Returns std::nullopt if fd is not a terminal or the size is unknown.
std::optional<uint64_t> terminal_width(int fd);

// Column count of the terminal behind stderr, the default progress sink.
std::optional<uint64_t> stderr_terminal_width();

// True if the stream is attached to a terminal.
bool is_terminal(std::FILE* stream);

} // namespace progression
