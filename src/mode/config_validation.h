// File: src/mode/config_validation.h
#pragma once

#include <vector>

#include "config/config.h"
#include "outcome.h"
#include "plugins/plugin_registry.h"

namespace pm {

struct ValidationSummary {
    std::size_t modes = 0;
    std::size_t errors = 0;     // unknown plugins + rejected configurations
    std::size_t warnings = 0;

    bool valid() const { return modes > 0 && errors == 0; }
};

// Runs configure() for every plugin of every mode without applying anything.
// Also warns about empty modes and about plugins missing from some modes.
ValidationSummary validateModes(const std::vector<Mode> &modes,
                                const plugins::PluginRegistry &registry,
                                OutcomeReporter &reporter);

} // namespace pm
