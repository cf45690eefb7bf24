#pragma once

#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>
#include <atomic>
#include <string>
#include <utility>
#include <vector>

#include "core/error.h"
#include "mode/outcome.h"
#include "plugins/plugin.h"

namespace pm::test {

class RecordingReporter : public OutcomeReporter {
public:
    void warning(const std::string &id, const std::string &detail) override {
        warnings.emplace_back(id, detail);
    }
    void pluginFailed(const std::string &id, const std::string &detail) override {
        failures.emplace_back(id, detail);
    }
    void modeFinished(const ModeOutcome &outcome) override {
        finished.push_back(outcome);
    }

    std::vector<std::pair<std::string, std::string>> warnings;
    std::vector<std::pair<std::string, std::string>> failures;
    std::vector<ModeOutcome> finished;
};

class RecordingSink : public plugins::WarningSink {
public:
    void warning(const std::string &detail) override { warnings.push_back(detail); }
    std::vector<std::string> warnings;
};

// Boolean plugin that counts configure/apply calls and accepts "skip".
class FakeSwitchPlugin : public plugins::Plugin {
public:
    struct Config : plugins::ValidatedConfig {
        bool on = false;
    };

    explicit FakeSwitchPlugin(std::string name) : m_name(std::move(name)) {}

    std::string name() const override { return m_name; }
    std::string version() const override { return "0.1"; }

    std::unique_ptr<plugins::ValidatedConfig> configure(const ConfigValue &raw) const override {
        ++configureCalls;
        if (raw.isString() && raw.asString() == plugins::kSkipSentinel)
            return std::make_unique<plugins::SkippedConfig>();
        if (!raw.isBoolean())
            throw ConfigError("must be a boolean");
        auto c = std::make_unique<Config>();
        c->on = raw.asBoolean();
        return c;
    }

    mutable std::atomic<int> configureCalls{0};
    std::atomic<int> applyCalls{0};
    std::atomic<int> sideEffects{0};
    bool failApply = false;
    std::string warnOnApply;

protected:
    void doApply(const plugins::ValidatedConfig &config, plugins::WarningSink &warnings) override {
        ++applyCalls;
        (void)configAs<Config>(config);
        if (!warnOnApply.empty())
            warnings.warning(warnOnApply);
        if (failApply)
            throw ApplyError("could not write the switch");
        ++sideEffects;
    }

private:
    std::string m_name;
};

// Appends lines to a shared file, guarded for concurrent writers.
class EventLog {
public:
    explicit EventLog(QString path) : m_path(std::move(path)) {}

    void append(const QString &line) {
        QMutexLocker lock(&m_mutex);
        QFile f(m_path);
        if (f.open(QIODevice::Append | QIODevice::Text))
            f.write((line + '\n').toUtf8());
    }

    QStringList lines() const {
        QFile f(m_path);
        if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
            return {};
        return QString::fromUtf8(f.readAll()).split('\n', Qt::SkipEmptyParts);
    }

    const QString &path() const { return m_path; }

private:
    QString m_path;
    QMutex m_mutex;
};

} // namespace pm::test
