// File: src/mode/console_reporter.cpp
#include "console_reporter.h"
#include "core/log.h"

#include <unistd.h>

namespace pm {

ConsoleReporter::ConsoleReporter(std::FILE *stream)
    : m_stream(stream), m_color(isatty(fileno(stream)) != 0) {}

void ConsoleReporter::print(const std::string &origin, bool isError, const std::string &message) {
    std::string line = origin.empty() ? std::string() : origin + " ";
    line += isError ? "error: " : "warning: ";
    line += message;

    if (m_color)
        std::fprintf(m_stream, "%s%s\x1b[39m\n", isError ? "\x1b[31m" : "\x1b[33m", line.c_str());
    else
        std::fprintf(m_stream, "%s\n", line.c_str());
    std::fflush(m_stream);

    if (isError)
        log_error(line.c_str());
    else
        log_warning(line.c_str());
}

void ConsoleReporter::warning(const std::string &pluginId, const std::string &detail) {
    print(pluginId, false, detail);
}

void ConsoleReporter::pluginFailed(const std::string &pluginId, const std::string &detail) {
    print(pluginId, true, detail);
}

void ConsoleReporter::modeFinished(const ModeOutcome &outcome) {
    if (!outcome.modeFound) {
        print("", true, "Powermode " + outcome.modeName + " not in configuration file.");
        return;
    }

    std::string failed;
    for (const PluginOutcome *o : outcome.failures()) {
        if (!failed.empty()) failed += ", ";
        failed += o->pluginId;
    }

    switch (outcome.status()) {
    case ModeOutcome::Status::Success:
        std::fprintf(m_stream, "Powermode %s applied.\n", outcome.modeName.c_str());
        std::fflush(m_stream);
        log_info(("Powermode " + outcome.modeName + " applied").c_str());
        break;
    case ModeOutcome::Status::PartialFailure:
        print("", false, "Powermode " + outcome.modeName + " partially applied. Failed plugins: "
              + failed + ". You may have ended up with a partially configured system.");
        break;
    case ModeOutcome::Status::TotalFailure:
        print("", true, "All plugins failed to apply mode " + outcome.modeName + ".");
        break;
    }
}

} // namespace pm
