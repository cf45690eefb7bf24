// File: src/plugins/builtin_plugins.h
#pragma once

#include "plugin_registry.h"

namespace pm::plugins {

// Registers every plugin shipped with powermodes under its own name.
void registerBuiltinPlugins(PluginRegistry &registry);

} // namespace pm::plugins
