#pragma once

#include <ostream>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "interval.hpp"

template <> struct fmt::formatter<Interval> : fmt::formatter<std::string_view> {
    auto format(const Interval& itvl, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "[{},{}]", itvl.Low, itvl.High);
    }
};

inline std::ostream& operator<<(std::ostream& out, const Interval& itvl) {
    fmt::print(out, "{}", itvl);
    return out;
}
