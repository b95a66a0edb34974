#pragma once

#include "bar/bar.hpp"
#include "bar/bar_config.hpp"

#include <cstdint>
#include <cstdio>
#include <iterator>
#include <memory>
#include <utility>

namespace progression {

// Sized range whose traversal drives a progress bar.
// Advancing past an element counts it, so the bar reaches 100% when the
// last element has been processed. The bar finishes when the range object
// is destroyed (at the end of a range-for over a temporary).
template <typename Range>
class ProgressRange {
public:
    using inner_iterator = decltype(std::begin(std::declval<Range&>()));

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = typename std::iterator_traits<inner_iterator>::value_type;
        using difference_type = typename std::iterator_traits<inner_iterator>::difference_type;
        using pointer = typename std::iterator_traits<inner_iterator>::pointer;
        using reference = typename std::iterator_traits<inner_iterator>::reference;

        iterator(inner_iterator it, Bar* bar, bool* write_failed)
            : it_(it), bar_(bar), write_failed_(write_failed) {}

        reference operator*() const { return *it_; }

        iterator& operator++() {
            ++it_;
            if (!bar_->increment(1)) *write_failed_ = true;
            return *this;
        }

        bool operator==(const iterator& other) const { return it_ == other.it_; }
        bool operator!=(const iterator& other) const { return it_ != other.it_; }

    private:
        inner_iterator it_;
        Bar* bar_;
        bool* write_failed_;
    };

    ProgressRange(Range&& range, BarConfig config, std::FILE* out,
                  const Logger* logger)
        : range_(std::forward<Range>(range)),
          bar_(std::make_unique<Bar>(static_cast<uint64_t>(std::size(range_)),
                                     std::move(config), out, logger)) {}

    iterator begin() { return iterator(std::begin(range_), bar_.get(), &write_failed_); }
    iterator end() { return iterator(std::end(range_), bar_.get(), &write_failed_); }

    Bar& bar() { return *bar_; }

    // False once any redraw during traversal failed to write.
    bool ok() const { return !write_failed_; }

private:
    Range range_; // reference for lvalue ranges, owned value for temporaries
    std::unique_ptr<Bar> bar_;
    bool write_failed_ = false;
};

template <typename Range>
ProgressRange<Range> progress(Range&& range, BarConfig config = BarConfig(),
                              std::FILE* out = stderr,
                              const Logger* logger = nullptr) {
    return ProgressRange<Range>(std::forward<Range>(range), std::move(config),
                                out, logger);
}

// Integers [0, n), for counting loops without a container.
class IndexRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = uint64_t;
        using difference_type = int64_t;
        using pointer = const uint64_t*;
        using reference = uint64_t;

        explicit iterator(uint64_t i) : i_(i) {}
        uint64_t operator*() const { return i_; }
        iterator& operator++() { ++i_; return *this; }
        bool operator==(const iterator& other) const { return i_ == other.i_; }
        bool operator!=(const iterator& other) const { return i_ != other.i_; }

    private:
        uint64_t i_;
    };

    explicit IndexRange(uint64_t n) : n_(n) {}

    iterator begin() const { return iterator(0); }
    iterator end() const { return iterator(n_); }
    uint64_t size() const { return n_; }

private:
    uint64_t n_;
};

inline ProgressRange<IndexRange> progress_n(uint64_t n, BarConfig config = BarConfig(),
                                            std::FILE* out = stderr,
                                            const Logger* logger = nullptr) {
    return progress(IndexRange(n), std::move(config), out, logger);
}

} // namespace progression
