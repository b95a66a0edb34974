#pragma once

#include <cstdio>
#include <cstdarg>

namespace progression {

// Leveled logger writing to a stdio stream (stderr by default).
// Each message is written under the stream lock, so a log line never
// lands in the middle of a progress frame written to the same stream.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::FILE* out = stderr)
        : level_(level), out_(out) {}

    void error(const char* fmt, ...) const {
        if (level_ < kError) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        if (level_ < kWarn) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        if (level_ < kInfo) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        if (level_ < kDebug) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    std::FILE* out_;

    void log_impl(const char* tag, const char* fmt, va_list ap) const {
        ::flockfile(out_);
        std::fprintf(out_, "[%s] ", tag);
        std::vfprintf(out_, fmt, ap);
        std::fputc('\n', out_);
        std::fflush(out_);
        ::funlockfile(out_);
    }
};

} // namespace progression
