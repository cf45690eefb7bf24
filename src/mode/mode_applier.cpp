// File: src/mode/mode_applier.cpp
#include "mode_applier.h"
#include "core/error.h"
#include "core/log.h"

#include <QFuture>
#include <QList>
#include <QMutexLocker>
#include <QThreadPool>
#include <QtConcurrent>

namespace pm {

namespace {

// Collects a plugin's warnings into its outcome and forwards them.
class OutcomeWarningSink : public plugins::WarningSink {
public:
    OutcomeWarningSink(PluginOutcome &outcome, OutcomeReporter &reporter, QMutex &mutex)
        : m_outcome(outcome), m_reporter(reporter), m_mutex(mutex) {}

    void warning(const std::string &detail) override {
        QMutexLocker lock(&m_mutex);
        m_outcome.warnings.push_back(detail);
        m_reporter.warning(m_outcome.pluginId, detail);
    }

private:
    PluginOutcome &m_outcome;
    OutcomeReporter &m_reporter;
    QMutex &m_mutex;
};

} // namespace

ModeApplier::ModeApplier(const plugins::PluginRegistry &registry, OutcomeReporter &reporter,
                         Policy policy)
    : m_registry(registry), m_reporter(reporter), m_policy(policy) {}

void ModeApplier::reportFailure(const std::string &pluginId, const std::string &detail) {
    QMutexLocker lock(&m_reportMutex);
    m_reporter.pluginFailed(pluginId, detail);
}

ModeOutcome ModeApplier::applyMode(const Mode &mode) {
    ModeOutcome outcome;
    outcome.modeName = mode.name;
    outcome.plugins.resize(mode.plugins.size());

    log_info(QString("Applying powermode '%1'").arg(QString::fromStdString(mode.name)).toUtf8().constData());

    // Resolve and configure, in table order. Nothing touches the system yet.
    std::vector<Job> jobs;
    for (std::size_t i = 0; i < mode.plugins.size(); ++i) {
        const std::string &id = mode.plugins[i].first;
        const ConfigValue &raw = mode.plugins[i].second;
        PluginOutcome &po = outcome.plugins[i];
        po.pluginId = id;

        plugins::Plugin *plugin = m_registry.resolve(id);
        if (!plugin) {
            po.kind = PluginOutcome::Kind::UnknownPlugin;
            po.detail = "unknown plugin";
            reportFailure(id, po.detail);
            continue;
        }

        try {
            jobs.push_back(Job{i, plugin, plugin->configure(raw)});
        } catch (const ConfigError &e) {
            po.kind = PluginOutcome::Kind::ConfigError;
            po.detail = e.what();
            reportFailure(id, po.detail);
        } catch (const std::exception &e) {
            po.kind = PluginOutcome::Kind::ConfigError;
            po.detail = std::string("configure failed unexpectedly: ") + e.what();
            reportFailure(id, po.detail);
        }
    }

    // Apply. No order is promised between distinct plugins.
    if (m_policy == Policy::Parallel && jobs.size() > 1) {
        QThreadPool pool;
        pool.setMaxThreadCount(static_cast<int>(jobs.size()));
        QList<QFuture<void>> running;
        for (auto &job : jobs)
            running << QtConcurrent::run(&pool, [this, &job, &outcome]() { runApply(job, outcome); });
        for (auto &f : running)
            f.waitForFinished();
    } else {
        for (auto &job : jobs)
            runApply(job, outcome);
    }

    {
        QMutexLocker lock(&m_reportMutex);
        m_reporter.modeFinished(outcome);
    }
    log_info(QString("Powermode '%1' finished: %2 plugin(s), %3 failed")
             .arg(QString::fromStdString(mode.name))
             .arg(outcome.plugins.size())
             .arg(outcome.failures().size())
             .toUtf8().constData());
    return outcome;
}

void ModeApplier::runApply(Job &job, ModeOutcome &outcome) {
    PluginOutcome &po = outcome.plugins[job.index];
    OutcomeWarningSink sink(po, m_reporter, m_reportMutex);

    try {
        job.plugin->apply(*job.config, sink);
        po.kind = job.config->isSkipped() ? PluginOutcome::Kind::Skipped
                                          : PluginOutcome::Kind::Success;
        log_debug(QString("Plugin %1: %2")
                  .arg(QString::fromStdString(po.pluginId), QString::fromLatin1(PluginOutcome::kindName(po.kind)))
                  .toUtf8().constData());
    } catch (const ApplyError &e) {
        po.kind = PluginOutcome::Kind::ApplyError;
        po.detail = e.what();
        reportFailure(po.pluginId, po.detail);
    } catch (const std::exception &e) {
        po.kind = PluginOutcome::Kind::ApplyError;
        po.detail = std::string("apply failed unexpectedly: ") + e.what();
        reportFailure(po.pluginId, po.detail);
    }
}

ModeOutcome ModeApplier::applyNamedMode(const std::vector<Mode> &modes, const std::string &name) {
    if (const Mode *mode = Config::findMode(modes, name))
        return applyMode(*mode);

    log_error(QString("Powermode '%1' not in configuration").arg(QString::fromStdString(name)).toUtf8().constData());
    ModeOutcome outcome;
    outcome.modeName = name;
    outcome.modeFound = false;
    QMutexLocker lock(&m_reportMutex);
    m_reporter.modeFinished(outcome);
    return outcome;
}

} // namespace pm
