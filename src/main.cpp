#include <QCoreApplication>
#include <QCommandLineParser>
#include <QStringList>
#include <QTextStream>
#include <cstdio>
#include <unistd.h>

#include "cli/console_prompter.h"
#include "config/config.h"
#include "core/error.h"
#include "core/log.h"
#include "mode/config_validation.h"
#include "mode/console_reporter.h"
#include "mode/mode_applier.h"
#include "plugins/builtin_plugins.h"

#ifndef POWERMODES_VERSION
#define POWERMODES_VERSION "unknown"
#endif

namespace {

enum ExitCode { ExitSuccess = 0, ExitPartial = 1, ExitFailure = 2 };

int exitCodeFor(const pm::ModeOutcome &outcome) {
    switch (outcome.status()) {
    case pm::ModeOutcome::Status::Success:        return ExitSuccess;
    case pm::ModeOutcome::Status::PartialFailure: return ExitPartial;
    case pm::ModeOutcome::Status::TotalFailure:   return ExitFailure;
    }
    return ExitFailure;
}

void fail(const QString &message) {
    std::fprintf(stderr, "error: %s\n", message.toUtf8().constData());
    log_error(message.toUtf8().constData());
}

std::vector<pm::Mode> loadModes(const QString &path, pm::OutcomeReporter &reporter) {
    const pm::ConfigValue tree = pm::Config::loadFile(path);
    QStringList warnings;
    std::vector<pm::Mode> modes = pm::Config::modes(tree, &warnings);
    for (const QString &w : warnings)
        reporter.warning("", w.toStdString());
    return modes;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("powermodes"));
    QCoreApplication::setApplicationVersion(QStringLiteral(POWERMODES_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Linux power consumption manager"));
    parser.addHelpOption();
    QCommandLineOption versionOpt(QStringLiteral("version"), QStringLiteral("Show the version of powermodes and of its plugins."));
    QCommandLineOption configOpt({QStringLiteral("c"), QStringLiteral("config")},
                                 QStringLiteral("Use CONFIG file (default %1).").arg(DEFAULT_CONFIG_PATH),
                                 QStringLiteral("CONFIG"), DEFAULT_CONFIG_PATH);
    QCommandLineOption modeOpt({QStringLiteral("m"), QStringLiteral("mode")},
                               QStringLiteral("Apply power MODE from CONFIG."), QStringLiteral("MODE"));
    QCommandLineOption interactiveOpt({QStringLiteral("i"), QStringLiteral("interactive")},
                                      QStringLiteral("Interactively choose the power mode."));
    QCommandLineOption validateOpt({QStringLiteral("v"), QStringLiteral("validate")},
                                   QStringLiteral("Validate CONFIG without applying anything."));
    QCommandLineOption pluginOpt({QStringLiteral("p"), QStringLiteral("plugin")},
                                 QStringLiteral("Interactively configure PLUGIN and print its YAML."), QStringLiteral("PLUGIN"));
    QCommandLineOption listOpt(QStringLiteral("list-plugins"), QStringLiteral("List available plugins."));
    QCommandLineOption parallelOpt(QStringLiteral("parallel"), QStringLiteral("Apply plugins concurrently."));
    QCommandLineOption debugOpt(QStringLiteral("debug"), QStringLiteral("Echo log messages to stderr."));
    parser.addOptions({versionOpt, configOpt, modeOpt, interactiveOpt, validateOpt, pluginOpt,
                       listOpt, parallelOpt, debugOpt});
    parser.process(app);

    if (parser.isSet(debugOpt)) {
        enable_debug_logging();  // enable first
        log_info("powermodes starting in DEBUG mode");
    }

    const int actions = int(parser.isSet(versionOpt)) + int(parser.isSet(modeOpt))
                      + int(parser.isSet(interactiveOpt)) + int(parser.isSet(validateOpt))
                      + int(parser.isSet(pluginOpt)) + int(parser.isSet(listOpt));
    if (actions > 1) {
        fail(QStringLiteral("Multiple actions specified in command-line arguments."));
        return ExitFailure;
    }
    if (actions == 0)
        parser.showHelp(ExitSuccess);

    if (parser.values(modeOpt).size() > 1 || parser.values(configOpt).size() > 1)
        std::fprintf(stderr, "warning: option given more than once; using the last value.\n");

    pm::plugins::PluginRegistry registry;
    pm::plugins::registerBuiltinPlugins(registry);
    pm::ConsoleReporter reporter;

    QTextStream out(stdout);
    QTextStream in(stdin);

    if (parser.isSet(versionOpt)) {
        out << "powermodes " << QCoreApplication::applicationVersion() << "\n\n"
            << "Versions of installed plugins:\n";
        for (const std::string &id : registry.ids())
            out << QString::fromStdString(id) << ' '
                << QString::fromStdString(registry.resolve(id)->version()) << '\n';
        return ExitSuccess;
    }

    if (parser.isSet(listOpt)) {
        for (const std::string &id : registry.ids()) {
            out << QString::fromStdString(id);
            if (registry.resolve(id)->isInteractive())
                out << " (interactive)";
            out << '\n';
        }
        return ExitSuccess;
    }

    if (parser.isSet(pluginOpt)) {
        const std::string id = parser.value(pluginOpt).toStdString();
        pm::plugins::Plugin *plugin = registry.resolve(id);
        if (!plugin) {
            fail(QStringLiteral("Unknown plugin %1.").arg(parser.value(pluginOpt)));
            return ExitFailure;
        }
        try {
            pm::cli::ConsolePrompter prompter(in, out);
            const pm::ConfigValue value = plugin->interact(prompter);
            plugin->configure(value);
            out << QString::fromStdString(pm::Config::toYaml(id, value)) << '\n';
        } catch (const pm::ConfigError &e) {
            fail(QString::fromStdString(id + ": " + e.what()));
            return ExitFailure;
        }
        return ExitSuccess;
    }

    const QString configPath = parser.value(configOpt);
    std::vector<pm::Mode> modes;
    try {
        modes = loadModes(configPath, reporter);
    } catch (const pm::ConfigError &e) {
        fail(QString::fromUtf8(e.what()));
        return ExitFailure;
    }

    if (parser.isSet(validateOpt)) {
        const pm::ValidationSummary summary = pm::validateModes(modes, registry, reporter);
        if (!summary.valid())
            return ExitPartial;
        out << QStringLiteral("Configuration %1 is valid (%2 powermode(s)).\n")
                   .arg(configPath).arg(summary.modes);
        return ExitSuccess;
    }

    // Applying modes writes kernel interfaces and runs commands as the caller.
    if (geteuid() != 0) {
        fail(QStringLiteral("powermodes must be run as root!"));
        return ExitFailure;
    }

    std::string modeName;
    if (parser.isSet(modeOpt)) {
        modeName = parser.values(modeOpt).constLast().toStdString();
    } else {
        if (modes.empty()) {
            fail(QStringLiteral("No powermodes in %1.").arg(configPath));
            return ExitFailure;
        }
        QStringList names;
        for (const auto &m : modes)
            names << QString::fromStdString(m.name);
        try {
            pm::cli::ConsolePrompter prompter(in, out);
            modeName = modes[prompter.chooseOption(names, QStringLiteral("Choose a powermode:"))].name;
        } catch (const pm::ConfigError &e) {
            fail(QString::fromUtf8(e.what()));
            return ExitFailure;
        }
    }

    const auto policy = parser.isSet(parallelOpt) ? pm::ModeApplier::Policy::Parallel
                                                  : pm::ModeApplier::Policy::Sequential;
    pm::ModeApplier applier(registry, reporter, policy);
    return exitCodeFor(applier.applyNamedMode(modes, modeName));
}
