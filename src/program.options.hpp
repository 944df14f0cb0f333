#pragma once

#include <cstdint>
#include <span>
#include <string>

#include <tl/expected.hpp>
#include <tl/optional.hpp>

#include "error.hpp"
#include "plot.config.hpp"

struct ProgramOptions {
    std::string config_file;
    PlotConfigOverrides overrides;
    tl::optional<int64_t> query_value;
    bool verbose{false};
    bool show_help{false};
    std::string usage;
};

/// args holds the full argv, program name first.
tl::expected<ProgramOptions, ProgramError> parse_program_options(std::span<const char* const> args);
