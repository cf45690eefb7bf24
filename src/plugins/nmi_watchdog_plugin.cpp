// File: src/plugins/nmi_watchdog_plugin.cpp
#include "nmi_watchdog_plugin.h"
#include "plugin_utils.h"
#include "core/error.h"
#include "core/log.h"

#include <QString>

namespace pm::plugins {

NmiWatchdogPlugin::NmiWatchdogPlugin(std::string path)
    : m_path(std::move(path)) {}

std::unique_ptr<ValidatedConfig> NmiWatchdogPlugin::configure(const ConfigValue &raw) const {
    if (isSkip(raw))
        return std::make_unique<SkippedConfig>();
    if (!raw.isBoolean())
        throw ConfigError("must be configured with a boolean or \"skip\", got " + raw.describe() + ".");

    auto config = std::make_unique<Config>();
    config->enabled = raw.asBoolean();
    return config;
}

void NmiWatchdogPlugin::doApply(const ValidatedConfig &config, WarningSink &) {
    const bool enabled = configAs<Config>(config).enabled;
    const char *action = enabled ? "enable" : "disable";

    if (!writeTextFile(m_path, enabled ? "1\n" : "0\n"))
        throw ApplyError(std::string("Failed to ") + action + " NMI watchdog (" + m_path + ").");

    log_info(QString("NMI watchdog %1d").arg(action).toUtf8().constData());
}

ConfigValue NmiWatchdogPlugin::interact(Prompter &prompter) const {
    const QStringList options{QStringLiteral("Enable"), QStringLiteral("Disable"),
                              QStringLiteral("Leave unchanged (skip)")};
    switch (prompter.chooseOption(options, QStringLiteral("NMI watchdog:"))) {
    case 0:  return ConfigValue::boolean(true);
    case 1:  return ConfigValue::boolean(false);
    default: return ConfigValue::string(kSkipSentinel);
    }
}

} // namespace pm::plugins
