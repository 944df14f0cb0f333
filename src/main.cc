#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <span>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "app.logging.hpp"
#include "error.hpp"
#include "interval.collection.hpp"
#include "interval.data.loader.hpp"
#include "interval.format.hpp"
#include "plot.config.hpp"
#include "program.options.hpp"

int main(int argc, char** argv) {
    const auto prog_opts = parse_program_options(
        std::span<const char* const>{static_cast<const char* const*>(argv), static_cast<size_t>(argc)});
    setup_logging(prog_opts && prog_opts->verbose ? quill::LogLevel::Debug : quill::LogLevel::Info);

    if (!prog_opts) {
        log_program_error(g_logger, prog_opts.error());
        return EXIT_FAILURE;
    }

    if (prog_opts->show_help) {
        std::cout << prog_opts->usage << "\n";
        return EXIT_SUCCESS;
    }

    PlotConfig plot_cfg{};
    if (!prog_opts->config_file.empty()) {
        const auto loaded_cfg = load_plot_config(prog_opts->config_file);
        if (!loaded_cfg) {
            log_program_error(g_logger, loaded_cfg.error());
            return EXIT_FAILURE;
        }
        plot_cfg = *loaded_cfg;
    }

    plot_cfg = apply_overrides(plot_cfg, prog_opts->overrides);

    const auto interval_data = read_interval_data(plot_cfg.data_file);
    if (!interval_data) {
        log_program_error(g_logger, interval_data.error());
        return EXIT_FAILURE;
    }

    const auto [min_low, max_high] = resolve_domain(plot_cfg, *interval_data);
    LOG_INFO(g_logger, "{} intervals, domain [{},{}]", interval_data->size(), min_low, max_high);

    IntervalCollection intervals{min_low, max_high};
    load_intervals(intervals, *interval_data);

    fmt::print("{}", intervals.print());

    if (prog_opts->query_value) {
        const std::vector<Interval> matches = intervals.find_intervals_for_value(*prog_opts->query_value);
        fmt::print(" • Intervals containing {}: {}\n", *prog_opts->query_value, fmt::join(matches, ", "));
    }

    return EXIT_SUCCESS;
}
