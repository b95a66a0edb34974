#include "test_util.hpp"
#include "util/terminal.hpp"

#include <cstdio>

using namespace progression;

static void test_invalid_fd() {
    CHECK(!terminal_width(-1).has_value());
}

static void test_regular_file_is_not_a_terminal() {
    std::FILE* f = std::tmpfile();
    CHECK(f != nullptr);
    CHECK(!terminal_width(::fileno(f)).has_value());
    CHECK(!is_terminal(f));
    std::fclose(f);
}

static void test_null_stream() {
    CHECK(!is_terminal(nullptr));
}

static void test_stderr_query_consistent() {
    // Under ctest stderr is usually redirected; either way the two agree
    auto w = stderr_terminal_width();
    if (!is_terminal(stderr)) {
        CHECK(!w.has_value());
    } else if (w) {
        CHECK(*w > 0u);
    }
}

int main() {
    test_invalid_fd();
    test_regular_file_is_not_a_terminal();
    test_null_stream();
    test_stderr_query_consistent();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
