#include "interval.collection.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "interval.format.hpp"

namespace {

// Available symbols: ( ◯ ◌ ◍ ◎ ● ◉ ), ( □ ■ ), ( ░ ▒ ▓ █ )
constexpr std::string_view kEmptySymbol{"◌"};
constexpr std::string_view kFullSymbol{"◎"};
constexpr std::string_view kOverlapSymbol{"●"};
constexpr std::string_view kSeparator{"║"};
constexpr int64_t kBlockSize{10};

bool is_an_overlap(const int64_t value, const std::vector<Interval>& overlapped) noexcept {
    return std::ranges::any_of(overlapped, [value](const Interval& ovrlp) { return ovrlp.contains(value); });
}

} // namespace

std::string IntervalCollection::print() {
    sort();

    const std::vector<Interval> overlaps = overlapped();
    const std::vector<Interval> gap_list = gaps();

    std::string graph;
    int64_t index = _min_low;
    int64_t num_separators = 0;
    bool exhausted = false;

    const auto advance_index = [&]() {
        if (index == std::numeric_limits<int64_t>::max()) {
            exhausted = true;
            return;
        }
        ++index;
        if (index % kBlockSize == 0) {
            graph += kSeparator;
            ++num_separators;
        }
    };

    for (const Interval& itvl : _intervals) {
        while (index < itvl.Low) {
            graph += kEmptySymbol;
            advance_index();
        }

        while (!exhausted && index <= itvl.High) {
            graph += is_an_overlap(index, overlaps) ? kOverlapSymbol : kFullSymbol;
            advance_index();
        }
    }

    for (int64_t i = index; i < _max_high; ++i) {
        graph += kEmptySymbol;
    }

    // the axis spans the graph width, separators included, minus the width of both labels
    std::string axis_legend = fmt::format(" {}", _min_low);
    const int64_t axis_padding = std::max<int64_t>(0, (_max_high - _min_low) + num_separators - 2);
    std::fill_n(std::back_inserter(axis_legend), axis_padding, ' ');
    fmt::format_to(std::back_inserter(axis_legend), "{}", _max_high);

    std::string out;
    auto out_itr = std::back_inserter(out);
    fmt::format_to(out_itr,
                   "\n\n==================================\n SUMMARY (minLow={}, maxHigh={})"
                   "\n==================================",
                   _min_low, _max_high);
    fmt::format_to(out_itr, "\n • Legend: {} (empty), {} (full), {} (overlap)", kEmptySymbol, kFullSymbol,
                   kOverlapSymbol);
    fmt::format_to(out_itr, "\n • Intervals: {}", fmt::join(_intervals, ", "));
    fmt::format_to(out_itr, "\n • Gaps: {}", fmt::join(gap_list, ", "));
    fmt::format_to(out_itr, "\n • Overlapped: {}", fmt::join(overlaps, ", "));
    fmt::format_to(out_itr, "\n\n{}\n╠{}╣\n", axis_legend, graph);

    return out;
}
