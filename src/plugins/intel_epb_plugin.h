// File: src/plugins/intel_epb_plugin.h
#pragma once

#include <utility>
#include <vector>

#include "plugin.h"

namespace pm::plugins {

// Intel Performance and Energy Bias Hint, written to every CPU's
// power/energy_perf_bias. Accepts 0..15, a preset name, or "skip".
class IntelEpbPlugin : public Plugin {
public:
    struct Config : ValidatedConfig {
        int value = 6;
    };

    explicit IntelEpbPlugin(std::string cpuRoot = "/sys/devices/system/cpu");

    std::string name() const override { return "intel_epb"; }
    std::string version() const override { return "1.0"; }

    std::unique_ptr<ValidatedConfig> configure(const ConfigValue &raw) const override;

    bool isInteractive() const override { return true; }
    ConfigValue interact(Prompter &prompter) const override;

    // Preset names accepted in place of a number, in kernel order.
    static const std::vector<std::pair<std::string, int>> &presets();

protected:
    void doApply(const ValidatedConfig &config, WarningSink &warnings) override;

private:
    std::string m_cpuRoot;
};

} // namespace pm::plugins
