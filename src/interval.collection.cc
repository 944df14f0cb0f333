#include "interval.collection.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <ranges>

void IntervalCollection::sort() {
    if (!_sorted) {
        std::ranges::sort(_intervals, IntervalByLow{});
    }
    _sorted = true;
}

std::vector<Interval> IntervalCollection::gaps() {
    sort();

    std::vector<Interval> gaps;
    int64_t last_high = _min_low;
    for (const Interval& itvl : _intervals) {
        if (itvl.Low > last_high) {
            gaps.emplace_back(last_high, itvl.Low - 1);
        }
        if (itvl.High == std::numeric_limits<int64_t>::max()) {
            // nothing left to uncover past the largest representable unit
            return gaps;
        }
        last_high = itvl.High + 1;
    }

    if (last_high < _max_high) {
        gaps.emplace_back(last_high, _max_high);
    }

    return gaps;
}

std::vector<Interval> IntervalCollection::overlapped() {
    sort();

    std::vector<Interval> overlaps;
    int64_t env_low = std::numeric_limits<int64_t>::max();
    int64_t env_high = std::numeric_limits<int64_t>::min();

    for (size_t idx = 0, count = _intervals.size(); idx < count; ++idx) {
        const Interval& itvl = _intervals[idx];

        if (idx > 0) {
            const bool low_in_between =
                in_between_inclusive(env_low, itvl.Low, itvl.High) || in_between_inclusive(itvl.Low, env_low, env_high);
            const bool high_in_between = in_between_inclusive(env_high, itvl.Low, itvl.High) ||
                                         in_between_inclusive(itvl.High, env_low, env_high);

            if (low_in_between || high_in_between) {
                overlaps.emplace_back(std::max(itvl.Low, env_low), std::min(itvl.High, env_high));
            }
        }

        env_low = std::min(env_low, itvl.Low);
        env_high = std::max(env_high, itvl.High);
    }

    return overlaps;
}

std::vector<Interval> IntervalCollection::find_intervals_for_value(const int64_t value) const {
    std::vector<Interval> matches;
    std::ranges::copy_if(_intervals, std::back_inserter(matches),
                         [value](const Interval& itvl) { return itvl.contains(value); });
    return matches;
}
