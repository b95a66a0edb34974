#include "test_util.hpp"
#include "bar/bar.hpp"
#include "bar/layout.hpp"
#include "util/number_format.hpp"

#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>

using namespace progression;

static Layout resolve_ok(const BarConfig& config, uint64_t total) {
    Layout layout;
    std::string error;
    bool ok = resolve_layout(config, total, layout, error);
    CHECK(ok);
    CHECK(error.empty());
    return layout;
}

static void test_default_layout() {
    // 80 - 35 - (0 + 0 + 4 * 2) - 0
    Layout layout = resolve_ok(BarConfig(), 1000);
    CHECK_EQ(layout.num_width, 4u);
    CHECK_EQ(layout.fill_width, 37u);
}

static void test_prefix_and_unit() {
    BarConfig config;
    config.prefix = "(items) ";
    config.unit = "files";
    // 80 - 35 - (8 + 5 + 1 * 2) - 1
    Layout layout = resolve_ok(config, 5);
    CHECK_EQ(layout.num_width, 1u);
    CHECK_EQ(layout.fill_width, 29u);
}

static void test_multibyte_prefix_counts_columns() {
    BarConfig config;
    config.prefix = "\xe2\x96\x88\xe2\x96\x88"; // two full blocks, six bytes
    Layout layout = resolve_ok(config, 1000);
    CHECK_EQ(layout.fill_width, 35u);
}

static void test_num_width_minimum() {
    BarConfig config;
    config.num_width = 10;
    Layout layout = resolve_ok(config, 1000);
    CHECK_EQ(layout.num_width, 10u);
    CHECK_EQ(layout.fill_width, 25u);

    // The minimum never shrinks a wider total
    config.num_width = 2;
    layout = resolve_ok(config, 123456);
    CHECK_EQ(layout.num_width, 6u);
}

static void test_grouped_total_widens_columns() {
    BarConfig config;
    config.number_format = [](uint64_t v) { return format_grouped(v); };
    Layout layout = resolve_ok(config, 1000000); // "1,000,000"
    CHECK_EQ(layout.num_width, 9u);
    CHECK_EQ(layout.fill_width, 27u);
}

static void test_width_sources() {
    BarConfig config;
    config.width_query = [] { return std::optional<uint64_t>(120); };
    CHECK_EQ(effective_width(config), 120u);
    CHECK_EQ(resolve_ok(config, 1000).fill_width, 77u);

    // Explicit width wins over the query
    config.width = 100;
    CHECK_EQ(effective_width(config), 100u);

    // Query without an answer falls back to the default
    BarConfig fallback;
    fallback.width_query = [] { return std::optional<uint64_t>(); };
    fallback.default_width = 60;
    CHECK_EQ(effective_width(fallback), 60u);
    CHECK_EQ(resolve_ok(fallback, 1000).fill_width, 17u);
}

static void test_zero_fill_width() {
    BarConfig config;
    config.width = 43;
    CHECK_EQ(resolve_ok(config, 1000).fill_width, 0u);
}

static void test_underflow_rejected() {
    BarConfig config;
    config.width = 42;
    Layout layout;
    std::string error;
    CHECK(!resolve_layout(config, 1000, layout, error));
    CHECK(!error.empty());

    bool threw = false;
    try {
        Bar bar(1000, config);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    CHECK(threw);
}

static void test_wide_delimiters() {
    BarConfig config;
    config.delimiters = {"<<", ">>"};
    // 80 - (35 - 2 + 2 + 2) - 4 * 2
    Layout layout = resolve_ok(config, 1000);
    CHECK_EQ(layout.fill_width, 35u);

    std::FILE* out = std::tmpfile();
    {
        Bar bar(1000, config, out);
        std::string frame = bar.format_frame(500, 0);
        CHECK_EQ(utf8_length(frame) - 2, 80u);
    }
    std::fclose(out);

    // Empty delimiters give their columns to the fill
    config.delimiters = {"", ""};
    CHECK_EQ(resolve_ok(config, 1000).fill_width, 39u);
}

static void test_multi_column_glyphs_rejected() {
    Layout layout;
    std::string error;

    BarConfig wide_fill;
    wide_fill.style = Style::mono("##");
    CHECK(!resolve_layout(wide_fill, 1000, layout, error));
    CHECK(error.find("fill") != std::string::npos);

    BarConfig wide_edge = BarConfig::cargo();
    wide_edge.style.edge = "=>";
    error.clear();
    CHECK(!resolve_layout(wide_edge, 1000, layout, error));
    CHECK(error.find("edge") != std::string::npos);

    BarConfig empty_space;
    empty_space.space = "";
    error.clear();
    CHECK(!resolve_layout(empty_space, 1000, layout, error));
    CHECK(error.find("space") != std::string::npos);

    // A multi-byte single character is one glyph
    BarConfig unicode = BarConfig::unicode();
    unicode.space = "\xc2\xb7";
    CHECK(resolve_layout(unicode, 1000, layout, error));
}

int main() {
    test_default_layout();
    test_prefix_and_unit();
    test_multibyte_prefix_counts_columns();
    test_num_width_minimum();
    test_grouped_total_widens_columns();
    test_width_sources();
    test_zero_fill_width();
    test_underflow_rejected();
    test_wide_delimiters();
    test_multi_column_glyphs_rejected();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
