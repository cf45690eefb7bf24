// File: src/mode/config_validation.cpp
#include "config_validation.h"
#include "core/error.h"

#include <map>

namespace pm {

ValidationSummary validateModes(const std::vector<Mode> &modes,
                                const plugins::PluginRegistry &registry,
                                OutcomeReporter &reporter) {
    ValidationSummary summary;
    summary.modes = modes.size();

    if (modes.empty()) {
        reporter.pluginFailed("", "Empty configuration: no powermodes defined.");
        ++summary.errors;
        return summary;
    }

    // plugin id -> modes configuring it (valid or not), in first-seen order
    std::vector<std::string> seenOrder;
    std::map<std::string, std::vector<std::string>> configuredIn;

    for (const Mode &mode : modes) {
        if (mode.plugins.empty()) {
            reporter.warning("", "Config specified empty powermode \"" + mode.name + "\".");
            ++summary.warnings;
        }

        for (const auto &entry : mode.plugins) {
            const std::string &id = entry.first;
            if (!configuredIn.count(id))
                seenOrder.push_back(id);
            configuredIn[id].push_back(mode.name);

            const plugins::Plugin *plugin = registry.resolve(id);
            if (!plugin) {
                reporter.pluginFailed(id, "unknown plugin in powermode " + mode.name + ".");
                ++summary.errors;
                continue;
            }
            try {
                plugin->configure(entry.second);
            } catch (const std::exception &e) {
                reporter.pluginFailed(id, "in powermode " + mode.name + ": " + e.what());
                ++summary.errors;
            }
        }
    }

    for (const std::string &id : seenOrder) {
        if (!registry.contains(id) || configuredIn[id].size() == modes.size())
            continue;

        std::string missing;
        for (const Mode &mode : modes) {
            bool has = false;
            for (const auto &m : configuredIn[id]) has = has || m == mode.name;
            if (has) continue;
            if (!missing.empty()) missing += ", ";
            missing += mode.name;
        }
        reporter.warning(id, "Not all powermodes have a configuration for " + id
                         + ". That means that you may get a partially configured system while "
                         "hopping between modes. Here are the missing powermodes: " + missing + ".");
        ++summary.warnings;
    }
    return summary;
}

} // namespace pm
