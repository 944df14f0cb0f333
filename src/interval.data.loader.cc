#include "interval.data.loader.hpp"

#include <cerrno>
#include <charconv>
#include <fstream>
#include <istream>
#include <string>

#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/std/FilesystemPath.h>
#include <tl/optional.hpp>

#include "interval.collection.hpp"

extern quill::Logger* g_logger;

namespace {

std::string_view skip_blanks(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    return s;
}

tl::optional<int64_t> consume_integer(std::string_view& s) noexcept {
    s = skip_blanks(s);
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
    }

    int64_t value{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{}) {
        return tl::nullopt;
    }

    s.remove_prefix(static_cast<size_t>(ptr - s.data()));
    return value;
}

} // namespace

tl::expected<Interval, ProgramError> parse_interval_line(std::string_view line, const uint32_t line_no) {
    const auto make_parse_error = [line, line_no](const char* reason) {
        return tl::make_unexpected(ProgramError{ParseError{line_no, std::string{line}, reason}});
    };

    std::string_view rest = line;
    const tl::optional<int64_t> low = consume_integer(rest);
    if (!low) {
        return make_parse_error("expected integer low bound");
    }

    if (rest.empty() || rest.front() != ',') {
        return make_parse_error("expected ',' after low bound");
    }
    rest.remove_prefix(1);

    const tl::optional<int64_t> high = consume_integer(rest);
    if (!high) {
        return make_parse_error("expected integer high bound");
    }

    if (*low > *high) {
        return tl::make_unexpected(ProgramError{InvalidIntervalError{line_no, *low, *high}});
    }

    return Interval{*low, *high};
}

tl::expected<std::vector<Interval>, ProgramError> read_interval_data(std::istream& input) {
    std::vector<Interval> intervals;
    std::string line;
    uint32_t line_no{0};

    while (std::getline(input, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        const std::string_view record = skip_blanks(line);
        if (record.empty() || record.front() == '#') {
            continue;
        }

        if (const auto itvl = parse_interval_line(record, line_no); itvl) {
            intervals.push_back(*itvl);
        } else {
            log_program_error(g_logger, itvl.error());
        }
    }

    if (input.bad()) {
        return tl::make_unexpected(
            ProgramError{SystemError{std::make_error_code(std::errc::io_error), "could not scan interval data"}});
    }

    LOG_DEBUG(g_logger, "Read {} intervals from {} lines", intervals.size(), line_no);
    return intervals;
}

tl::expected<std::vector<Interval>, ProgramError> read_interval_data(const std::filesystem::path& path) {
    std::ifstream input{path};
    if (!input) {
        const int err = errno;
        return tl::make_unexpected(ProgramError{SystemError{std::error_code{err != 0 ? err : ENOENT, std::generic_category()},
                                                            "could not read " + path.string()}});
    }

    LOG_INFO(g_logger, "Reading interval data from {}", path);
    return read_interval_data(input);
}

void load_intervals(IntervalCollection& collection, const std::vector<Interval>& intervals) {
    for (const Interval& itvl : intervals) {
        collection.add(itvl);
    }
}
