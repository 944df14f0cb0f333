#include "plot.config.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <rfl.hpp>
#include <rfl/json.hpp>

extern quill::Logger* g_logger;

tl::expected<PlotConfig, ProgramError> load_plot_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return tl::make_unexpected(ProgramError{SystemError{
            ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory), "could not open " + path.string()}});
    }

    try {
        const PlotConfig cfg = rfl::json::load<PlotConfig, rfl::DefaultIfMissing>(path.string()).value();
        LOG_DEBUG(g_logger, "Config {}: domain [{},{}], self adjust min {} max {}, data file {}", path.string(),
                  cfg.min_low, cfg.max_high, cfg.self_adjust_min_low, cfg.self_adjust_max_high, cfg.data_file);
        return cfg;
    } catch (const std::exception& e) {
        return tl::make_unexpected(ProgramError{ConfigError{path.string(), e.what()}});
    }
}

PlotConfig apply_overrides(PlotConfig cfg, const PlotConfigOverrides& overrides) {
    cfg.data_file = overrides.data_file.value_or(cfg.data_file);
    cfg.min_low = overrides.min_low.value_or(cfg.min_low);
    cfg.max_high = overrides.max_high.value_or(cfg.max_high);
    return cfg;
}

std::pair<int64_t, int64_t> resolve_domain(const PlotConfig& cfg, std::span<const Interval> intervals) noexcept {
    int64_t min_low = cfg.min_low;
    int64_t max_high = cfg.max_high;

    for (const Interval& itvl : intervals) {
        if (cfg.self_adjust_min_low) {
            min_low = std::min(min_low, itvl.Low);
        }
        if (cfg.self_adjust_max_high) {
            max_high = std::max(max_high, itvl.High);
        }
    }

    return {min_low, max_high};
}
