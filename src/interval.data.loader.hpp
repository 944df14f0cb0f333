#pragma once

#include <filesystem>
#include <iosfwd>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "error.hpp"
#include "interval.hpp"

class IntervalCollection;

/// Parses one "low,high" record. Anything after the high bound is ignored.
tl::expected<Interval, ProgramError> parse_interval_line(std::string_view line, const uint32_t line_no = 0);

/// Reads one record per line. Bad records are logged and discarded, only stream failures are errors.
tl::expected<std::vector<Interval>, ProgramError> read_interval_data(std::istream& input);
tl::expected<std::vector<Interval>, ProgramError> read_interval_data(const std::filesystem::path& path);

void load_intervals(IntervalCollection& collection, const std::vector<Interval>& intervals);
