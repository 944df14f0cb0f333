#pragma once

#include <cstdint>
#include <quill/Logger.h>
#include <string>
#include <system_error>
#include <variant>

struct SystemError {
    std::error_code e;
    std::string context;
};

struct ParseError {
    uint32_t line;
    std::string text;
    std::string reason;
};

struct InvalidIntervalError {
    uint32_t line;
    int64_t low;
    int64_t high;
};

struct ConfigError {
    std::string file;
    std::string message;
};

struct UsageError {
    std::string message;
};

using ProgramError =
    std::variant<std::monostate, SystemError, ParseError, InvalidIntervalError, ConfigError, UsageError>;

std::string describe_program_error(const ProgramError& err);
void log_program_error(quill::Logger* logger, const ProgramError& err);
