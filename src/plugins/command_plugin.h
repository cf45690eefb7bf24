// File: src/plugins/command_plugin.h
#pragma once

#include <vector>

#include "command_executor.h"
#include "plugin.h"

namespace pm::plugins {

// Runs arbitrary commands, strictly in list order.
//
//   command:
//     - command: "echo 1 > /sys/some/knob"      # through /bin/sh
//     - command: [systemctl, stop, bluetooth]   # no shell
//       show-stdout: true
//       warning-on-failure: false
class CommandPlugin : public Plugin {
public:
    struct Config : ValidatedConfig {
        std::vector<CommandDescriptor> commands;
    };

    explicit CommandPlugin(CommandExecutor executor = CommandExecutor());

    std::string name() const override { return "command"; }
    std::string version() const override { return "1.0"; }

    std::unique_ptr<ValidatedConfig> configure(const ConfigValue &raw) const override;

    // Parses one list element. `number` is 1-based, for messages.
    static CommandDescriptor parseDescriptor(const ConfigValue &entry, std::size_t number);

protected:
    void doApply(const ValidatedConfig &config, WarningSink &warnings) override;

private:
    CommandExecutor m_executor;
};

} // namespace pm::plugins
