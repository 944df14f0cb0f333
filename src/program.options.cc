#include "program.options.hpp"

#include <sstream>

#include <lyra/lyra.hpp>

tl::expected<ProgramOptions, ProgramError> parse_program_options(std::span<const char* const> args) {
    ProgramOptions prog_opts{};
    auto cli =
        lyra::cli{} | lyra::help(prog_opts.show_help) |
        lyra::opt{prog_opts.config_file, "config"}["-c"]["--config"]("JSON plot configuration file") |
        lyra::opt{[&prog_opts](const std::string& f) { prog_opts.overrides.data_file = f; },
                  "data"}["-d"]["--data"]("interval data file, one 'low,high' per line") |
        lyra::opt{[&prog_opts](int64_t v) { prog_opts.overrides.min_low = v; }, "min"}["--min"]("domain low bound") |
        lyra::opt{[&prog_opts](int64_t v) { prog_opts.overrides.max_high = v; }, "max"}["--max"]("domain high bound") |
        lyra::opt{[&prog_opts](int64_t v) { prog_opts.query_value = v; },
                  "value"}["-v"]["--value"]("list the intervals containing this value") |
        lyra::opt{prog_opts.verbose}["--verbose"]("debug logging");

    if (const auto arg_parse_res = cli.parse({static_cast<int>(args.size()), args.data()}); !arg_parse_res) {
        return tl::make_unexpected(ProgramError{UsageError{arg_parse_res.message()}});
    }

    if (prog_opts.show_help) {
        std::ostringstream usage;
        usage << cli;
        prog_opts.usage = usage.str();
    }

    return prog_opts;
}
