// File: src/plugins/command_plugin.cpp
#include "command_plugin.h"
#include "plugin_utils.h"
#include "core/error.h"
#include "core/log.h"

namespace pm::plugins {

namespace {

std::string commandLabel(std::size_t number) {
    return "Command number " + std::to_string(number);
}

bool optionalBoolean(const ConfigValue &entry, const char *key, bool fallback,
                     std::size_t number) {
    const ConfigValue *v = entry.find(key);
    if (!v)
        return fallback;
    if (!v->isBoolean())
        throw ConfigError(commandLabel(number) + ": \"" + key + "\" must be a boolean, got "
                          + ConfigValue::typeName(v->type()) + ".");
    return v->asBoolean();
}

} // namespace

CommandPlugin::CommandPlugin(CommandExecutor executor)
    : m_executor(std::move(executor)) {}

CommandDescriptor CommandPlugin::parseDescriptor(const ConfigValue &entry, std::size_t number) {
    if (!entry.isTable())
        throw ConfigError(commandLabel(number) + " must be a table.");

    rejectUnknownKeys(entry.asTable(),
                      {"command", "allow-stdin", "show-stdout", "show-stderr", "warning-on-failure"},
                      commandLabel(number));

    CommandDescriptor d;
    const ConfigValue *command = entry.find("command");
    if (!command)
        throw ConfigError(commandLabel(number) + " must have a value for \"command\".");

    if (command->isString()) {
        d.useShell = true;
        d.shellCommand = command->asString();
    } else if (command->isList()) {
        const auto &items = command->asList();
        if (items.empty())
            throw ConfigError(commandLabel(number) + ": \"command\" must not be an empty list.");
        d.useShell = false;
        for (const auto &item : items) {
            if (!item.isString())
                throw ConfigError(commandLabel(number) + ": \"command\" must be a string or "
                                  "a list of strings, found " + item.describe() + ".");
            d.argv.push_back(item.asString());
        }
    } else {
        throw ConfigError(commandLabel(number) + ": \"command\" must be a string or a list "
                          "of strings.");
    }

    d.allowStdin       = optionalBoolean(entry, "allow-stdin",        false, number);
    d.showStdout       = optionalBoolean(entry, "show-stdout",        false, number);
    d.showStderr       = optionalBoolean(entry, "show-stderr",        true,  number);
    d.warningOnFailure = optionalBoolean(entry, "warning-on-failure", true,  number);
    return d;
}

std::unique_ptr<ValidatedConfig> CommandPlugin::configure(const ConfigValue &raw) const {
    if (!raw.isList())
        throw ConfigError("must be configured with a list of commands, got "
                          + std::string(ConfigValue::typeName(raw.type())) + ".");

    auto config = std::make_unique<Config>();
    std::size_t number = 1;
    for (const auto &entry : raw.asList())
        config->commands.push_back(parseDescriptor(entry, number++));
    return config;
}

void CommandPlugin::doApply(const ValidatedConfig &config, WarningSink &warnings) {
    const auto &commands = configAs<Config>(config).commands;
    QStringList notStarted;

    for (std::size_t i = 0; i < commands.size(); ++i) {
        const CommandDescriptor &cmd = commands[i];
        const std::size_t number = i + 1;
        const ExecutionResult r = m_executor.run(cmd);

        if (!r.started) {
            // The remaining commands still run.
            const QString msg = QString("Command %1 (%2) could not be started: %3")
                                    .arg(number).arg(cmd.display(), r.errorString);
            warnings.warning(msg.toStdString());
            notStarted << QString::number(number);
            continue;
        }

        if (r.succeeded() || !cmd.warningOnFailure)
            continue;

        QString msg = r.crashed
            ? QString("Command %1 was terminated abnormally.").arg(number)
            : QString("Command %1 left with error code %2.").arg(number).arg(r.exitCode);
        if (!cmd.showStderr) {
            QString err = QString::fromUtf8(r.standardError);
            if (err.endsWith('\n'))
                err.chop(1);
            if (!err.isEmpty())
                msg += QStringLiteral(" Here's the program's stderr:\n") + err;
        }
        warnings.warning(msg.toStdString());
    }

    if (!notStarted.isEmpty())
        throw ApplyError("failed to start command(s) " + notStarted.join(", ").toStdString()
                         + " of " + std::to_string(commands.size()) + ".");
}

} // namespace pm::plugins
