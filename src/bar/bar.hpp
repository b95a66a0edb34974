#pragma once

#include "bar/bar_config.hpp"
#include "bar/layout.hpp"
#include "util/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

namespace progression {

// Single-line progress bar redrawn in place on a stdio stream.
//
// increment() may be called concurrently from any number of threads.
// Redraws are throttled to one per config.throttle_ms; the thread that
// claims the redraw slot draws the frame, the others return immediately.
// The final frame and a newline are written exactly once, by finish() or
// by the destructor, whichever runs first.
class Bar {
public:
    // Throws std::invalid_argument if the configured width cannot hold
    // the counters, clocks, prefix and unit.
    explicit Bar(uint64_t total, BarConfig config = BarConfig(),
                 std::FILE* out = stderr, const Logger* logger = nullptr);
    ~Bar();

    Bar(const Bar&) = delete;
    Bar& operator=(const Bar&) = delete;

    // Advance by delta and redraw if the throttle interval has passed.
    // Throws std::out_of_range (position unchanged) if the position would
    // pass the total. Returns false if a redraw failed to write.
    bool increment(uint64_t delta = 1);

    // Draw the final frame and end the line. Later calls do nothing.
    // Returns false if writing failed.
    bool finish();

    uint64_t total() const { return total_; }
    uint64_t position() const { return pos_.load(); }
    bool finished() const { return finished_.load(); }
    const Layout& layout() const { return layout_; }
    const BarConfig& config() const { return config_; }

    // Number of frames drawn so far, finish included.
    uint64_t render_count() const { return renders_.load(); }

    // Frame text for a given position and elapsed time,
    // starting and ending with '\r'.
    std::string format_frame(uint64_t position, uint64_t elapsed_ms) const;

private:
    BarConfig config_;
    uint64_t total_;
    std::string total_str_;
    Layout layout_;
    std::FILE* out_;
    const Logger* logger_;
    std::chrono::steady_clock::time_point start_;

    std::atomic<uint64_t> pos_{0};
    std::atomic<uint64_t> last_render_ms_{0};
    std::atomic<uint64_t> renders_{0};
    std::atomic<bool> finished_{false};

    bool render(bool final_frame);
    uint64_t elapsed_millis() const;
    std::string format_number(uint64_t value) const;
};

} // namespace progression
