#include "error.hpp"

#include <fmt/format.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

template <typename... Visitors> struct VariantVisitor : public Visitors... {
    VariantVisitor() : Visitors{}... {}
    VariantVisitor(Visitors&&... visitors) : Visitors{std::forward<Visitors>(visitors)}... {}

    using Visitors::operator()...;
};

std::string describe_program_error(const ProgramError& err) {
    return std::visit(VariantVisitor{
                          [](const SystemError& sys_err) {
                              return fmt::format("{}: {} ({})", sys_err.context, sys_err.e.message(),
                                                 sys_err.e.value());
                          },
                          [](const ParseError& parse_err) {
                              return fmt::format("line {}: bad data point '{}': {}", parse_err.line, parse_err.text,
                                                 parse_err.reason);
                          },
                          [](const InvalidIntervalError& itvl_err) {
                              return fmt::format("line {}: bad data point (low, high)=({},{}): low can not be "
                                                 "greater than high",
                                                 itvl_err.line, itvl_err.low, itvl_err.high);
                          },
                          [](const ConfigError& cfg_err) {
                              return fmt::format("config {}: {}", cfg_err.file, cfg_err.message);
                          },
                          [](const UsageError& usage_err) { return fmt::format("usage: {}", usage_err.message); },
                          [](std::monostate) { return std::string{"no error"}; },
                      },
                      err);
}

void log_program_error(quill::Logger* logger, const ProgramError& err) {
    std::visit(VariantVisitor{
                   [logger, &err](const SystemError&) { LOG_ERROR(logger, "{}", describe_program_error(err)); },
                   [logger, &err](const ParseError&) { LOG_WARNING(logger, "{}", describe_program_error(err)); },
                   [logger, &err](const InvalidIntervalError&) {
                       LOG_WARNING(logger, "{}", describe_program_error(err));
                   },
                   [logger, &err](const ConfigError&) { LOG_ERROR(logger, "{}", describe_program_error(err)); },
                   [logger, &err](const UsageError&) { LOG_ERROR(logger, "{}", describe_program_error(err)); },
                   [](std::monostate) {},
               },
               err);
}
