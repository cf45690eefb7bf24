// File: src/plugins/intel_pstate_plugin.cpp
#include "intel_pstate_plugin.h"
#include "plugin_utils.h"
#include "core/error.h"
#include "core/log.h"

#include <QString>
#include <filesystem>

namespace pm::plugins {

namespace {

std::optional<int> percentage(const ConfigValue &table, const char *key) {
    const ConfigValue *v = table.find(key);
    if (!v)
        return std::nullopt;
    if (!v->isInteger() || v->asInteger() < 0 || v->asInteger() > 100)
        throw ConfigError(std::string("\"") + key + "\" must be an integer from 0 to 100, got "
                          + v->describe() + ".");
    return static_cast<int>(v->asInteger());
}

std::optional<bool> flag(const ConfigValue &table, const char *key) {
    const ConfigValue *v = table.find(key);
    if (!v)
        return std::nullopt;
    if (!v->isBoolean())
        throw ConfigError(std::string("\"") + key + "\" must be a boolean, got " + v->describe() + ".");
    return v->asBoolean();
}

std::string trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == ' '))
        s.pop_back();
    return s;
}

} // namespace

IntelPstatePlugin::IntelPstatePlugin(std::string driverDir)
    : m_driverDir(std::move(driverDir)) {}

std::string IntelPstatePlugin::file(const char *name) const {
    return (std::filesystem::path(m_driverDir) / name).string();
}

std::unique_ptr<ValidatedConfig> IntelPstatePlugin::configure(const ConfigValue &raw) const {
    if (isSkip(raw))
        return std::make_unique<SkippedConfig>();
    if (!raw.isTable())
        throw ConfigError("must be configured with a table or \"skip\", got " + raw.describe() + ".");
    if (raw.asTable().empty())
        throw ConfigError("configuration table is empty (use \"skip\" to leave the driver alone).");

    rejectUnknownKeys(raw.asTable(),
                      {"min-percentage", "max-percentage", "turbo", "energy-efficient", "dynamic-boost"},
                      "intel_pstate configuration");

    auto config = std::make_unique<Config>();
    config->minPercentage   = percentage(raw, "min-percentage");
    config->maxPercentage   = percentage(raw, "max-percentage");
    config->turbo           = flag(raw, "turbo");
    config->energyEfficient = flag(raw, "energy-efficient");
    config->dynamicBoost    = flag(raw, "dynamic-boost");

    if (config->minPercentage && config->maxPercentage
        && *config->minPercentage > *config->maxPercentage)
        throw ConfigError("min-percentage can't be larger than max-percentage.");
    return config;
}

void IntelPstatePlugin::doApply(const ValidatedConfig &config, WarningSink &warnings) {
    const Config &cfg = configAs<Config>(config);

    const auto status = readTextFile(file("status"));
    if (!status)
        throw ApplyError("Failed to read intel_pstate status from " + file("status") + ".");
    const std::string mode = trimmed(*status);
    if (mode == "off")
        throw ApplyError("intel_pstate driver is off.");
    if (mode != "active" && mode != "passive")
        throw ApplyError("intel_pstate reported an unknown status: \"" + mode + "\".");
    const bool active = mode == "active";

    int attempted = 0;
    int failed = 0;
    auto write = [&](const char *name, const std::string &value, const char *label) {
        ++attempted;
        if (writeTextFile(file(name), value + "\n")) {
            log_info(QString("Applied intel_pstate %1 = %2")
                     .arg(QString::fromLatin1(label), QString::fromStdString(value)).toUtf8().constData());
            return;
        }
        ++failed;
        warnings.warning(std::string("Failed to set ") + label + " (" + file(name) + ").");
    };

    // The kernel rejects min > max at every step, so raise max first when
    // the new min would exceed the current max.
    if (cfg.minPercentage || cfg.maxPercentage) {
        bool maxFirst = false;
        if (cfg.minPercentage) {
            const auto currentMax = readTextFile(file("max_perf_pct"));
            try {
                maxFirst = currentMax && *cfg.minPercentage > std::stoi(*currentMax);
            } catch (const std::exception &) {
                maxFirst = true;
            }
        }
        if (maxFirst && cfg.maxPercentage)
            write("max_perf_pct", std::to_string(*cfg.maxPercentage), "max-percentage");
        if (cfg.minPercentage)
            write("min_perf_pct", std::to_string(*cfg.minPercentage), "min-percentage");
        if (!maxFirst && cfg.maxPercentage)
            write("max_perf_pct", std::to_string(*cfg.maxPercentage), "max-percentage");
    }

    if (cfg.turbo) {
        std::error_code ec;
        if (std::filesystem::exists(file("no_turbo"), ec))
            write("no_turbo", *cfg.turbo ? "0" : "1", "turbo");
        else
            warnings.warning("This CPU has no turbo control; \"turbo\" was not applied.");
    }

    if (cfg.energyEfficient) {
        if (active)
            write("energy_efficiency", *cfg.energyEfficient ? "1" : "0", "energy-efficient");
        else
            warnings.warning("\"energy-efficient\" is only available in active mode; not applied.");
    }

    if (cfg.dynamicBoost) {
        if (active)
            write("hwp_dynamic_boost", *cfg.dynamicBoost ? "1" : "0", "dynamic-boost");
        else
            warnings.warning("\"dynamic-boost\" is only available in active mode; not applied.");
    }

    if (attempted > 0 && failed == attempted)
        throw ApplyError("Every intel_pstate write failed.");
}

} // namespace pm::plugins
