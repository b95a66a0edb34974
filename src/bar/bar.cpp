#include "bar/bar.hpp"
#include "bar/time_format.hpp"
#include "core/config.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace progression {

namespace {

void append_right_aligned(std::string& line, const std::string& s, size_t width) {
    if (s.size() < width) line.append(width - s.size(), ' ');
    line += s;
}

// Holds the stdio stream lock for one frame.
class StreamLock {
public:
    explicit StreamLock(std::FILE* f) : f_(f) { ::flockfile(f_); }
    ~StreamLock() { ::funlockfile(f_); }

    StreamLock(const StreamLock&) = delete;
    StreamLock& operator=(const StreamLock&) = delete;

private:
    std::FILE* f_;
};

void append_repeated(std::string& line, const std::string& glyph, uint64_t count) {
    for (uint64_t i = 0; i < count; i++) line += glyph;
}

} // namespace

Bar::Bar(uint64_t total, BarConfig config, std::FILE* out, const Logger* logger)
    : config_(std::move(config)),
      total_(total),
      out_(out ? out : stderr),
      logger_(logger) {
    total_str_ = format_number(total_);

    std::string error;
    if (!resolve_layout(config_, total_, layout_, error)) {
        throw std::invalid_argument("progress bar layout: " + error);
    }
    if (logger_) {
        logger_->debug("progress bar: total=%lu num_width=%zu fill_width=%lu",
                       static_cast<unsigned long>(total_), layout_.num_width,
                       static_cast<unsigned long>(layout_.fill_width));
    }

    start_ = std::chrono::steady_clock::now();
}

Bar::~Bar() {
    try {
        finish();
    } catch (const std::exception& e) {
        if (logger_) logger_->error("progress bar: final frame failed: %s", e.what());
    }
}

bool Bar::increment(uint64_t delta) {
    uint64_t cur = pos_.load();
    do {
        if (delta > total_ - cur) {
            throw std::out_of_range("progress position " + std::to_string(cur) +
                                    " + " + std::to_string(delta) +
                                    " exceeds total " + std::to_string(total_));
        }
    } while (!pos_.compare_exchange_weak(cur, cur + delta));

    uint64_t elapsed = elapsed_millis();
    uint64_t last = last_render_ms_.load();

    // Another thread may already have claimed a later slot (last > elapsed)
    if (elapsed > last && elapsed - last > config_.throttle_ms &&
        last_render_ms_.compare_exchange_strong(last, elapsed)) {
        return render(false);
    }
    return true;
}

bool Bar::finish() {
    if (finished_.exchange(true)) return true;
    return render(true);
}

bool Bar::render(bool final_frame) {
    bool ok;
    int saved_errno = 0;
    {
        StreamLock lock(out_);

        // Position is read under the stream lock so frames appear in
        // non-decreasing position order.
        std::string frame = format_frame(pos_.load(), elapsed_millis());
        ok = std::fwrite(frame.data(), 1, frame.size(), out_) == frame.size();
        if (!ok) saved_errno = errno;

        // The line terminator is attempted even if the frame failed.
        if (final_frame && std::fputc('\n', out_) == EOF) {
            if (ok) saved_errno = errno;
            ok = false;
        }
        if (std::fflush(out_) != 0) {
            if (ok) saved_errno = errno;
            ok = false;
        }
    }
    renders_.fetch_add(1);

    if (!ok && logger_) {
        logger_->error("progress bar: write failed: %s", std::strerror(saved_errno));
    }
    return ok;
}

std::string Bar::format_frame(uint64_t position, uint64_t elapsed_ms) const {
    const uint64_t fill_width = layout_.fill_width;

    double ratio = total_ == 0
        ? 1.0
        : static_cast<double>(position) / static_cast<double>(total_);
    uint64_t filled = static_cast<uint64_t>(
        std::llround(ratio * static_cast<double>(fill_width)));
    if (filled > fill_width) filled = fill_width;
    bool complete = position >= total_;

    auto eta = estimate_eta(position, total_, static_cast<double>(elapsed_ms) / 1000.0);

    std::string line;
    line.reserve(fill_width * 3 + 96);
    line += '\r';
    line += config_.prefix;
    line += ' ';
    line += format_clock(elapsed_ms / 1000);
    line += ' ';
    append_right_aligned(line, format_number(position), layout_.num_width);
    line += " / ";
    append_right_aligned(line, total_str_, layout_.num_width);
    if (!config_.unit.empty()) {
        line += ' ';
        line += config_.unit;
    }
    line += ' ';
    line += config_.delimiters.first;
    append_repeated(line, config_.style.fill, filled);
    line += complete ? config_.style.fill : config_.style.edge;
    append_repeated(line, config_.space, fill_width - filled);
    line += config_.delimiters.second;

    char pct[32];
    std::snprintf(pct, sizeof(pct), " %3.0f%% ETA ", ratio * 100.0);
    line += pct;
    line += eta ? format_clock(*eta) : std::string(CLOCK_SENTINEL);
    line += '\r';
    return line;
}

uint64_t Bar::elapsed_millis() const {
    auto d = std::chrono::steady_clock::now() - start_;
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
}

std::string Bar::format_number(uint64_t value) const {
    return config_.number_format ? config_.number_format(value) : format_plain(value);
}

} // namespace progression
