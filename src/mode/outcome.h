// File: src/mode/outcome.h
#pragma once

#include <string>
#include <vector>

namespace pm {

// What happened to one plugin entry of a mode.
struct PluginOutcome {
    enum class Kind {
        Success,
        Skipped,        // "skip" sentinel: apply ran as a no-op
        ConfigError,    // rejected by configure(), never applied
        ApplyError,     // apply() failed, possibly after partial effects
        UnknownPlugin   // no plugin registered under this id
    };

    std::string pluginId;
    Kind kind = Kind::Success;
    std::string detail;                 // error text for the failure kinds
    std::vector<std::string> warnings;  // non-fatal, raised while applying

    bool failed() const {
        return kind == Kind::ConfigError || kind == Kind::ApplyError || kind == Kind::UnknownPlugin;
    }

    static const char *kindName(Kind kind);
};

struct ModeOutcome {
    enum class Status {
        Success,        // nothing failed
        PartialFailure, // some plugins failed, others were applied or skipped
        TotalFailure    // mode not found, or every plugin failed
    };

    std::string modeName;
    bool modeFound = true;
    std::vector<PluginOutcome> plugins;   // mode table order

    bool succeeded() const { return status() == Status::Success; }
    Status status() const;

    std::vector<const PluginOutcome *> failures() const;
    const PluginOutcome *find(const std::string &pluginId) const;
};

// Receives diagnostics while modes are validated or applied. The applier
// serializes calls, even when plugins run concurrently. An empty plugin id
// designates powermodes itself.
class OutcomeReporter {
public:
    virtual ~OutcomeReporter() = default;

    virtual void warning(const std::string &pluginId, const std::string &detail) = 0;
    virtual void pluginFailed(const std::string &pluginId, const std::string &detail) = 0;
    virtual void modeFinished(const ModeOutcome &outcome) = 0;
};

} // namespace pm
