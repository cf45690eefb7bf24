// File: src/plugins/nmi_watchdog_plugin.h
#pragma once

#include "plugin.h"

namespace pm::plugins {

// Enables / disables the NMI (non-maskable interrupt) watchdog.
// Accepts a boolean or "skip".
class NmiWatchdogPlugin : public Plugin {
public:
    struct Config : ValidatedConfig {
        bool enabled = false;
    };

    explicit NmiWatchdogPlugin(std::string path = "/proc/sys/kernel/nmi_watchdog");

    std::string name() const override { return "nmi_watchdog"; }
    std::string version() const override { return "1.0"; }

    std::unique_ptr<ValidatedConfig> configure(const ConfigValue &raw) const override;

    bool isInteractive() const override { return true; }
    ConfigValue interact(Prompter &prompter) const override;

protected:
    void doApply(const ValidatedConfig &config, WarningSink &warnings) override;

private:
    std::string m_path;
};

} // namespace pm::plugins
