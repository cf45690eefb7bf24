// File: src/plugins/intel_epb_plugin.cpp
#include "intel_epb_plugin.h"
#include "plugin_utils.h"
#include "core/error.h"
#include "core/log.h"

#include <QString>
#include <filesystem>

namespace pm::plugins {

namespace fs = std::filesystem;

IntelEpbPlugin::IntelEpbPlugin(std::string cpuRoot)
    : m_cpuRoot(std::move(cpuRoot)) {}

const std::vector<std::pair<std::string, int>> &IntelEpbPlugin::presets() {
    static const std::vector<std::pair<std::string, int>> table = {
        {"performance",         0},
        {"balance-performance", 4},
        {"normal",              6},
        {"default",             6},
        {"normal-powersave",    7},
        {"balance-power",       8},
        {"power",              15},
    };
    return table;
}

std::unique_ptr<ValidatedConfig> IntelEpbPlugin::configure(const ConfigValue &raw) const {
    if (isSkip(raw))
        return std::make_unique<SkippedConfig>();

    auto config = std::make_unique<Config>();
    if (raw.isInteger() && raw.asInteger() >= 0 && raw.asInteger() <= 15) {
        config->value = static_cast<int>(raw.asInteger());
        return config;
    }
    if (raw.isString()) {
        for (const auto &p : presets()) {
            if (p.first == raw.asString()) {
                config->value = p.second;
                return config;
            }
        }
    }

    std::string accepted;
    for (const auto &p : presets())
        accepted += (accepted.empty() ? "\"" : ", \"") + p.first + "\"";
    throw ConfigError("must be configured with an integer between 0 and 15, \"skip\", or one "
                      "of the following strings: " + accepted + ". Got " + raw.describe() + ".");
}

void IntelEpbPlugin::doApply(const ValidatedConfig &config, WarningSink &warnings) {
    const int value = configAs<Config>(config).value;

    const auto cpus = listCpuDirectories(m_cpuRoot);
    if (cpus.empty())
        throw ApplyError("No CPUs detected in " + m_cpuRoot + ".");

    std::vector<fs::path> files;
    QStringList unsupported;
    std::error_code ec;
    for (const auto &cpu : cpus) {
        fs::path f = cpu / "power" / "energy_perf_bias";
        if (fs::is_regular_file(f, ec))
            files.push_back(f);
        else
            unsupported << QString::fromStdString(cpu.filename().string());
    }

    if (files.empty())
        throw ApplyError("EPB is not supported in this system.");
    if (!unsupported.isEmpty())
        warnings.warning(("The following CPUs don't support EPB: " + unsupported.join(", ")).toStdString());

    const std::string text = std::to_string(value) + "\n";
    bool anyWritten = false;
    for (const auto &f : files) {
        const std::string cpu = f.parent_path().parent_path().filename().string();
        if (writeTextFile(f.string(), text)) {
            anyWritten = true;
        } else {
            warnings.warning("Failed to set Intel EPB state for " + cpu + ".");
        }
    }

    if (!anyWritten)
        throw ApplyError("Failed to set Intel EPB state on every CPU (value " + std::to_string(value) + ").");

    log_info(QString("Intel EPB set to %1").arg(value).toUtf8().constData());
}

ConfigValue IntelEpbPlugin::interact(Prompter &prompter) const {
    QStringList options;
    for (const auto &p : presets())
        options << QStringLiteral("%1 (%2)").arg(QString::fromStdString(p.first)).arg(p.second);
    options << QStringLiteral("Leave unchanged (skip)");

    const int choice = prompter.chooseOption(options, QStringLiteral("Intel energy / performance bias:"));
    if (choice >= 0 && choice < static_cast<int>(presets().size()))
        return ConfigValue::string(presets()[choice].first);
    return ConfigValue::string(kSkipSentinel);
}

} // namespace pm::plugins
