#pragma once

#include <cstdint>
#include <limits>

struct Interval {
    int64_t Low{};
    int64_t High{};

    Interval() noexcept = default;
    constexpr Interval(const int64_t low_, const int64_t high_) noexcept : Low{low_}, High{high_} {}

    constexpr bool contains(const int64_t x) const noexcept { return Low <= x && x <= High; }

    friend constexpr bool operator==(const Interval&, const Interval&) noexcept = default;

    struct Stdc;
};

struct Interval::Stdc {
    static constexpr int64_t DefaultMinLow{0};
    static constexpr int64_t DefaultMaxHigh{std::numeric_limits<int64_t>::max()};
};

/// Orders intervals by their low bound only.
struct IntervalByLow {
    constexpr bool operator()(const Interval& a, const Interval& b) const noexcept { return a.Low < b.Low; }
};

constexpr bool in_between_inclusive(const int64_t value, const int64_t low, const int64_t high) noexcept {
    return low <= value && value <= high;
}
