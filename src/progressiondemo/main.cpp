#include "core/config.hpp"
#include "core/version.hpp"
#include "bar/bar.hpp"
#include "bar/bar_config.hpp"
#include "bar/bar_range.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"
#include "util/number_format.hpp"
#include "util/terminal.hpp"

#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace progression;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Without -style, runs the default, cargo, unicode, custom and manual\n"
        "bars one after another.\n"
        "\n"
        "Options:\n"
        "  -n <int>              Items per bar (default: 1000)\n"
        "  -delay <ms>           Work time per item in milliseconds (default: 1)\n"
        "  -style <name>         ascii, unicode, cargo or a single custom glyph\n"
        "  -prefix <text>        Text drawn before the clock\n"
        "  -unit <text>          Unit drawn after the counters\n"
        "  -width <int>          Total line width (default: %lu)\n"
        "  -auto_width           Use the terminal width when stderr is a terminal\n"
        "  -throttle <ms>        Minimum redraw interval (default: %lu)\n"
        "  -grouped              Group counter digits by thousands\n"
        "  -threads <int>        Worker threads incrementing one bar (default: 1,\n"
        "                        0 = all cores)\n"
        "  -v, --verbose         Verbose output\n"
        "  -q, --quiet           Errors only\n"
        "  --version             Print version\n"
        "  -h, --help            Show this help\n",
        prog,
        static_cast<unsigned long>(DEFAULT_WIDTH),
        static_cast<unsigned long>(DEFAULT_THROTTLE_MS));
}

static BarConfig config_for_style(const std::string& style) {
    if (style == "ascii") return BarConfig::ascii();
    if (style == "unicode") return BarConfig::unicode();
    if (style == "cargo") return BarConfig::cargo();
    BarConfig config;
    config.style = Style::mono(style);
    return config;
}

// Options shared by every bar the demo draws.
static void apply_options(const CliParser& cli, BarConfig& config) {
    if (cli.has("-prefix")) config.prefix = cli.get_string("-prefix");
    if (cli.has("-unit")) config.unit = cli.get_string("-unit");
    if (cli.has("-width")) config.width = cli.get_uint64("-width", DEFAULT_WIDTH);
    if (cli.has("-auto_width")) config.width_query = stderr_terminal_width;
    config.throttle_ms = cli.get_uint64("-throttle", DEFAULT_THROTTLE_MS);
    if (cli.has("-grouped")) {
        config.number_format = [](uint64_t v) { return format_grouped(v); };
    }
}

static void work(uint64_t delay_ms) {
    if (delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
}

static bool run_range(uint64_t n, uint64_t delay_ms, BarConfig config,
                      const Logger& logger) {
    auto items = progress_n(n, std::move(config), stderr, &logger);
    for (uint64_t i : items) {
        (void)i;
        work(delay_ms);
    }
    bool finished = items.bar().finish();
    return finished && items.ok();
}

static bool run_manual(uint64_t delay_ms, BarConfig config, const Logger& logger) {
    std::vector<int> items = {1, 2, 3, 4, 5};
    Bar bar(items.size(), std::move(config), stderr, &logger);

    bool ok = true;
    for (int item : items) {
        (void)item;
        work(delay_ms * 100);
        if (!bar.increment(1)) ok = false;
    }
    if (!bar.finish()) ok = false;
    return ok;
}

static bool run_parallel(uint64_t n, uint64_t delay_ms, int threads,
                         BarConfig config, const Logger& logger) {
    tbb::global_control gc(tbb::global_control::max_allowed_parallelism, threads);
    tbb::task_arena arena(threads);

    Bar bar(n, std::move(config), stderr, &logger);
    std::atomic<bool> write_failed{false};

    arena.execute([&] {
        tbb::parallel_for(
            tbb::blocked_range<uint64_t>(0, n),
            [&](const tbb::blocked_range<uint64_t>& range) {
                for (uint64_t i = range.begin(); i < range.end(); i++) {
                    work(delay_ms);
                    if (!bar.increment(1)) {
                        write_failed.store(true, std::memory_order_relaxed);
                    }
                }
            });
    });

    bool ok = bar.finish() && !write_failed.load();
    logger.debug("parallel run: %lu items on %d threads, %lu frames drawn",
                 static_cast<unsigned long>(bar.position()), threads,
                 static_cast<unsigned long>(bar.render_count()));
    return ok;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "progressiondemo")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(cli.program().c_str());
        return 0;
    }

    if (!cli.positional().empty()) {
        std::fprintf(stderr, "Error: unexpected argument '%s'\n",
                     cli.positional().front().c_str());
        print_usage(cli.program().c_str());
        return 1;
    }

    Logger logger = make_logger(cli);

    uint64_t n = cli.get_uint64("-n", 1000);
    uint64_t delay_ms = cli.get_uint64("-delay", 1);
    int threads = resolve_threads(cli);

    if (cli.has("-auto_width") && !is_terminal(stderr)) {
        logger.warn("stderr is not a terminal, using the default width");
    }

    try {
        if (cli.has("-style") || threads > 1) {
            BarConfig config = config_for_style(cli.get_string("-style", "ascii"));
            apply_options(cli, config);
            logger.info("Style: %s, items: %lu, threads: %d",
                        cli.get_string("-style", "ascii").c_str(),
                        static_cast<unsigned long>(n), threads);

            bool ok = threads > 1
                ? run_parallel(n, delay_ms, threads, std::move(config), logger)
                : run_range(n, delay_ms, std::move(config), logger);
            return ok ? 0 : 1;
        }

        struct Demo {
            const char* name;
            BarConfig config;
        };
        std::vector<Demo> demos = {
            {"default", BarConfig()},
            {"cargo", BarConfig::cargo()},
            {"unicode", BarConfig::unicode()},
            {"custom", config_for_style("·")},
        };

        for (auto& demo : demos) {
            apply_options(cli, demo.config);
            logger.info("%s style", demo.name);
            if (!run_range(n, delay_ms, std::move(demo.config), logger)) return 1;
        }

        BarConfig manual = BarConfig::cargo();
        apply_options(cli, manual);
        if (!cli.has("-prefix")) manual.prefix = "(items) ";
        logger.info("manual increments");
        if (!run_manual(delay_ms, std::move(manual), logger)) return 1;
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
