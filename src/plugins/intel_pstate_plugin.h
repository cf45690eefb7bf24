// File: src/plugins/intel_pstate_plugin.h
#pragma once

#include <optional>

#include "plugin.h"

namespace pm::plugins {

// Tunables of the intel_pstate scaling driver. Every key is optional; a key
// left out keeps its current value.
//
//   intel_pstate:
//     min-percentage: 10
//     max-percentage: 60
//     turbo: false
//     energy-efficient: true     # active mode only
//     dynamic-boost: false       # active mode only
class IntelPstatePlugin : public Plugin {
public:
    struct Config : ValidatedConfig {
        std::optional<int>  minPercentage;
        std::optional<int>  maxPercentage;
        std::optional<bool> turbo;
        std::optional<bool> energyEfficient;
        std::optional<bool> dynamicBoost;
    };

    explicit IntelPstatePlugin(std::string driverDir = "/sys/devices/system/cpu/intel_pstate");

    std::string name() const override { return "intel_pstate"; }
    std::string version() const override { return "1.0"; }

    std::unique_ptr<ValidatedConfig> configure(const ConfigValue &raw) const override;

protected:
    void doApply(const ValidatedConfig &config, WarningSink &warnings) override;

private:
    std::string file(const char *name) const;

    std::string m_driverDir;
};

} // namespace pm::plugins
