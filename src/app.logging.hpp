#pragma once

#include <quill/Logger.h>
#include <quill/core/LogLevel.h>

extern quill::Logger* g_logger;

/// Starts the quill backend and creates the global logger writing to stderr. Safe to call more than once.
quill::Logger* setup_logging(const quill::LogLevel level = quill::LogLevel::Info);
