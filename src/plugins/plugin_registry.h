// File: src/plugins/plugin_registry.h
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "plugin.h"

namespace pm::plugins {

// Owns the loaded plugins, keyed by the id used in configuration files.
// Populated once at startup, read-only afterwards (safe to share between
// threads applying different plugins).
class PluginRegistry {
public:
    PluginRegistry() = default;
    PluginRegistry(const PluginRegistry &) = delete;
    PluginRegistry &operator=(const PluginRegistry &) = delete;
    PluginRegistry(PluginRegistry &&) = default;
    PluginRegistry &operator=(PluginRegistry &&) = default;

    // Throws RegistryError on a duplicate or malformed id, or a null plugin.
    void registerPlugin(const std::string &id, std::unique_ptr<Plugin> plugin);

    // Exact, case-sensitive lookup. nullptr when unknown.
    Plugin *resolve(const std::string &id) const;
    bool contains(const std::string &id) const { return resolve(id) != nullptr; }

    // Registered ids, sorted.
    std::vector<std::string> ids() const;
    std::size_t size() const { return m_plugins.size(); }

    // Lowercase letters, digits (not leading) and underscores.
    static bool isValidId(const std::string &id);

private:
    std::map<std::string, std::unique_ptr<Plugin>> m_plugins;
};

} // namespace pm::plugins
