#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "interval.hpp"

/// Closed integer intervals over the domain [min_low, max_high].
///
/// Sorting is lazy: add() marks the collection dirty and every query that needs
/// ascending order (sort, gaps, overlapped, print) sorts in place first.
/// Not thread safe, callers serialize access.
class IntervalCollection {
public:
    IntervalCollection() noexcept : IntervalCollection{Interval::Stdc::DefaultMinLow, Interval::Stdc::DefaultMaxHigh} {}
    IntervalCollection(const int64_t min_low, const int64_t max_high) noexcept
        : _min_low{min_low}, _max_high{max_high} {}

    void add(const Interval& itvl) {
        _intervals.push_back(itvl);
        _sorted = false;
    }

    /// Sorts by low bound if anything was added since the last sort. Equal lows keep no particular order.
    void sort();

    /// Uncovered sub-ranges of the domain. The cursor is reset to high + 1 after every interval,
    /// so an interval nested inside a wider one moves it backwards. An interval ending at
    /// INT64_MAX covers the rest of the domain.
    std::vector<Interval> gaps();

    /// Intersections of every interval with the running envelope [min low, max high] of all
    /// intervals before it. Results are not merged.
    std::vector<Interval> overlapped();

    /// Every interval containing value, in current order. Does not sort.
    std::vector<Interval> find_intervals_for_value(const int64_t value) const;

    /// Text summary of the collection with a one symbol per unit graph of the domain.
    /// Output grows with max_high - min_low, so the domain must be small enough to draw.
    std::string print();

    std::span<const Interval> intervals() const noexcept { return _intervals; }
    int64_t min_low() const noexcept { return _min_low; }
    int64_t max_high() const noexcept { return _max_high; }
    bool is_sorted() const noexcept { return _sorted; }
    size_t size() const noexcept { return _intervals.size(); }
    bool empty() const noexcept { return _intervals.empty(); }

private:
    std::vector<Interval> _intervals;
    int64_t _min_low;
    int64_t _max_high;
    bool _sorted{false};
};
