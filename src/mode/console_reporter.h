// File: src/mode/console_reporter.h
#pragma once

#include <cstdio>

#include "outcome.h"

namespace pm {

// Prints diagnostics for the operator and mirrors them to the journal.
// Colour is used when the stream is a terminal.
class ConsoleReporter : public OutcomeReporter {
public:
    explicit ConsoleReporter(std::FILE *stream = stderr);

    void warning(const std::string &pluginId, const std::string &detail) override;
    void pluginFailed(const std::string &pluginId, const std::string &detail) override;
    void modeFinished(const ModeOutcome &outcome) override;

private:
    void print(const std::string &origin, bool isError, const std::string &message);

    std::FILE *m_stream;
    bool m_color;
};

} // namespace pm
