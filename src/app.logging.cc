#include "app.logging.hpp"

#include <utility>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/sinks/ConsoleSink.h>

quill::Logger* g_logger{};

quill::Logger* setup_logging(const quill::LogLevel level) {
    if (!g_logger) {
        quill::Backend::start();

        // stdout carries the rendered summary, diagnostics go to stderr
        auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console_sink", []() {
            quill::ConsoleSinkConfig cfg;
            cfg.set_stream("stderr");
            return cfg;
        }());

        quill::PatternFormatterOptions pfo;
        pfo.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "LOG_%(log_level:<9) %(message)";
        pfo.timestamp_pattern = ("%H:%M:%S.%Qms");
        pfo.timestamp_timezone = quill::Timezone::GmtTime;
        g_logger = quill::Frontend::create_or_get_logger("global_logger", std::move(console_sink), pfo);
    }

    g_logger->set_log_level(level);
    return g_logger;
}
