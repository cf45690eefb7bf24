// File: src/plugins/plugin_registry.cpp
#include "plugin_registry.h"
#include "core/error.h"
#include "core/log.h"

#include <QRegularExpression>
#include <QString>

namespace pm::plugins {

bool PluginRegistry::isValidId(const std::string &id) {
    static const QRegularExpression pattern(
        QRegularExpression::anchoredPattern(QStringLiteral("[a-z_][a-z0-9_]*")));
    return pattern.match(QString::fromStdString(id)).hasMatch();
}

void PluginRegistry::registerPlugin(const std::string &id, std::unique_ptr<Plugin> plugin) {
    if (!isValidId(id))
        throw RegistryError("invalid plugin id \"" + id + "\"");
    if (!plugin)
        throw RegistryError("null plugin registered as \"" + id + "\"");
    if (m_plugins.count(id))
        throw RegistryError("plugin \"" + id + "\" is already registered");

    log_debug(QString("Registered plugin %1 %2")
              .arg(QString::fromStdString(id), QString::fromStdString(plugin->version()))
              .toUtf8().constData());
    m_plugins.emplace(id, std::move(plugin));
}

Plugin *PluginRegistry::resolve(const std::string &id) const {
    auto it = m_plugins.find(id);
    return it == m_plugins.end() ? nullptr : it->second.get();
}

std::vector<std::string> PluginRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(m_plugins.size());
    for (const auto &kv : m_plugins)
        out.push_back(kv.first);
    return out;
}

} // namespace pm::plugins
