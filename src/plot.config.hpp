#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <utility>

#include <tl/expected.hpp>
#include <tl/optional.hpp>

#include "error.hpp"
#include "interval.hpp"

struct PlotConfig {
    int64_t min_low{0};
    int64_t max_high{40};
    bool self_adjust_min_low{false};
    bool self_adjust_max_high{true};
    std::string data_file{"data.txt"};
};

/// Values given on the command line, each replacing the configured one when set.
struct PlotConfigOverrides {
    tl::optional<std::string> data_file;
    tl::optional<int64_t> min_low;
    tl::optional<int64_t> max_high;
};

/// Fields missing from the file keep their defaults.
tl::expected<PlotConfig, ProgramError> load_plot_config(const std::filesystem::path& path);

/// Domain bounds for the collection. Self adjustment only ever widens the configured domain.
std::pair<int64_t, int64_t> resolve_domain(const PlotConfig& cfg, std::span<const Interval> intervals) noexcept;

PlotConfig apply_overrides(PlotConfig cfg, const PlotConfigOverrides& overrides);
