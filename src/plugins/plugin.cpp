// File: src/plugins/plugin.cpp
#include "plugin.h"
#include "core/error.h"

namespace pm::plugins {

void Plugin::apply(const ValidatedConfig &config, WarningSink &warnings) {
    if (config.isSkipped())
        return;
    doApply(config, warnings);
}

ConfigValue Plugin::interact(Prompter &) const {
    throw ConfigError(name() + " does not support interactive configuration");
}

void Plugin::throwForeignConfig() const {
    throw ApplyError(name() + " was handed a configuration it did not produce");
}

} // namespace pm::plugins
