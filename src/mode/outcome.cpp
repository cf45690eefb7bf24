// File: src/mode/outcome.cpp
#include "outcome.h"

#include <algorithm>

namespace pm {

const char *PluginOutcome::kindName(Kind kind) {
    switch (kind) {
    case Kind::Success:       return "success";
    case Kind::Skipped:       return "skipped";
    case Kind::ConfigError:   return "configuration error";
    case Kind::ApplyError:    return "apply error";
    case Kind::UnknownPlugin: return "unknown plugin";
    }
    return "?";
}

ModeOutcome::Status ModeOutcome::status() const {
    if (!modeFound)
        return Status::TotalFailure;

    const auto failed = std::count_if(plugins.begin(), plugins.end(),
                                      [](const PluginOutcome &o) { return o.failed(); });
    if (failed == 0)
        return Status::Success;
    if (failed == static_cast<long>(plugins.size()))
        return Status::TotalFailure;
    return Status::PartialFailure;
}

std::vector<const PluginOutcome *> ModeOutcome::failures() const {
    std::vector<const PluginOutcome *> out;
    for (const auto &o : plugins) {
        if (o.failed()) out.push_back(&o);
    }
    return out;
}

const PluginOutcome *ModeOutcome::find(const std::string &pluginId) const {
    for (const auto &o : plugins) {
        if (o.pluginId == pluginId) return &o;
    }
    return nullptr;
}

} // namespace pm
