// File: src/plugins/builtin_plugins.cpp
#include "builtin_plugins.h"
#include "command_plugin.h"
#include "intel_epb_plugin.h"
#include "intel_pstate_plugin.h"
#include "nmi_watchdog_plugin.h"

namespace pm::plugins {

void registerBuiltinPlugins(PluginRegistry &registry) {
    std::vector<std::unique_ptr<Plugin>> builtins;
    builtins.push_back(std::make_unique<CommandPlugin>());
    builtins.push_back(std::make_unique<NmiWatchdogPlugin>());
    builtins.push_back(std::make_unique<IntelEpbPlugin>());
    builtins.push_back(std::make_unique<IntelPstatePlugin>());

    for (auto &p : builtins) {
        const std::string id = p->name();
        registry.registerPlugin(id, std::move(p));
    }
}

} // namespace pm::plugins
