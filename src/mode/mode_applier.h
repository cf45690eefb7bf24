// File: src/mode/mode_applier.h
#pragma once

#include <QMutex>
#include <string>
#include <vector>

#include "config/config.h"
#include "outcome.h"
#include "plugins/plugin_registry.h"

namespace pm {

// Drives configure + apply for every plugin a mode names and aggregates the
// per-plugin outcomes. One failing plugin never stops the others.
class ModeApplier {
public:
    enum class Policy {
        Sequential,  // apply in mode table order
        Parallel     // apply every configured plugin on its own pool thread
    };

    ModeApplier(const plugins::PluginRegistry &registry, OutcomeReporter &reporter,
                Policy policy = Policy::Sequential);

    ModeOutcome applyMode(const Mode &mode);

    // Looks `name` up first; a missing mode is a total failure.
    ModeOutcome applyNamedMode(const std::vector<Mode> &modes, const std::string &name);

    Policy policy() const { return m_policy; }

private:
    struct Job {
        std::size_t index;
        plugins::Plugin *plugin;
        std::unique_ptr<plugins::ValidatedConfig> config;
    };

    void runApply(Job &job, ModeOutcome &outcome);
    void reportFailure(const std::string &pluginId, const std::string &detail);

    const plugins::PluginRegistry &m_registry;
    OutcomeReporter &m_reporter;
    Policy m_policy;
    QMutex m_reportMutex;   // serializes reporter calls and log ordering
};

} // namespace pm
