// File: src/plugins/plugin.h
#pragma once

#include <QString>
#include <QStringList>
#include <memory>
#include <string>

#include "core/config_value.h"

namespace pm::plugins {

// Reserved configuration string meaning "leave this facet as it is".
// Only plugins that document it accept it.
inline constexpr const char *kSkipSentinel = "skip";

// Result of a successful configure(). Concrete plugins derive their own
// typed configuration from it; only the plugin that produced it consumes it.
class ValidatedConfig {
public:
    virtual ~ValidatedConfig() = default;
    virtual bool isSkipped() const { return false; }
};

// The operator explicitly asked to leave the facet untouched.
class SkippedConfig final : public ValidatedConfig {
public:
    bool isSkipped() const override { return true; }
};

// Receives non-fatal diagnostics raised while a plugin applies.
class WarningSink {
public:
    virtual ~WarningSink() = default;
    virtual void warning(const std::string &detail) = 0;
};

// Asks the operator to pick one option. Returns the zero-based index.
// Throws ConfigError when no answer can be obtained.
class Prompter {
public:
    virtual ~Prompter() = default;
    virtual int chooseOption(const QStringList &options, const QString &message) = 0;
};

// Handler for one facet of power configuration.
class Plugin {
public:
    virtual ~Plugin() = default;

    // Metadata
    virtual std::string name() const = 0;
    virtual std::string version() const = 0;

    // Interprets `raw` without touching the system. Throws ConfigError.
    virtual std::unique_ptr<ValidatedConfig> configure(const ConfigValue &raw) const = 0;

    // Performs the side effect. A skipped configuration never reaches
    // doApply(). Throws ApplyError.
    void apply(const ValidatedConfig &config, WarningSink &warnings);

    // Interactive configuration (optional). The returned value is meant to be
    // fed back into configure().
    virtual bool isInteractive() const { return false; }
    virtual ConfigValue interact(Prompter &prompter) const;

protected:
    virtual void doApply(const ValidatedConfig &config, WarningSink &warnings) = 0;

    // Downcast helper for doApply() implementations. Throws ApplyError when
    // handed a configuration produced by a different plugin.
    template <typename T>
    const T &configAs(const ValidatedConfig &config) const {
        const T *typed = dynamic_cast<const T *>(&config);
        if (!typed)
            throwForeignConfig();
        return *typed;
    }

private:
    [[noreturn]] void throwForeignConfig() const;
};

} // namespace pm::plugins
