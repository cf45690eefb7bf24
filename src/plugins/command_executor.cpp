// File: src/plugins/command_executor.cpp
#include "command_executor.h"
#include "core/log.h"

#include <QProcess>

namespace pm::plugins {

QString CommandDescriptor::display() const {
    if (useShell)
        return QString::fromStdString(shellCommand);
    QStringList parts;
    for (const auto &a : argv)
        parts << QString::fromStdString(a);
    return QStringLiteral("[%1]").arg(parts.join(QStringLiteral(", ")));
}

bool CommandDescriptor::operator==(const CommandDescriptor &other) const {
    return useShell == other.useShell && shellCommand == other.shellCommand
        && argv == other.argv && allowStdin == other.allowStdin
        && showStdout == other.showStdout && showStderr == other.showStderr
        && warningOnFailure == other.warningOnFailure;
}

CommandExecutor::CommandExecutor(QString shell)
    : m_shell(std::move(shell)) {}

ExecutionResult CommandExecutor::run(const CommandDescriptor &command) const {
    ExecutionResult result;

    QString program;
    QStringList arguments;
    if (command.useShell) {
        program = m_shell;
        arguments << QStringLiteral("-c") << QString::fromStdString(command.shellCommand);
    } else {
        if (command.argv.empty()) {
            result.errorString = QStringLiteral("empty argument vector");
            return result;
        }
        program = QString::fromStdString(command.argv.front());
        for (auto it = command.argv.begin() + 1; it != command.argv.end(); ++it)
            arguments << QString::fromStdString(*it);
    }

    QProcess p;

    // A child must never wait for interactive input unless allowed to.
    if (command.allowStdin)
        p.setInputChannelMode(QProcess::ForwardedInputChannel);
    else
        p.setStandardInputFile(QProcess::nullDevice());

    if (command.showStdout && command.showStderr)
        p.setProcessChannelMode(QProcess::ForwardedChannels);
    else if (command.showStdout)
        p.setProcessChannelMode(QProcess::ForwardedOutputChannel);
    else if (command.showStderr)
        p.setProcessChannelMode(QProcess::ForwardedErrorChannel);
    else
        p.setProcessChannelMode(QProcess::SeparateChannels);

    if (!command.showStdout)
        p.setStandardOutputFile(QProcess::nullDevice());

    log_debug(QString("Running command %1").arg(command.display()).toUtf8().constData());

    p.start(program, arguments);
    if (!p.waitForStarted(-1)) {
        result.errorString = p.errorString();
        return result;
    }
    result.started = true;

    // No timeout: a hung child blocks until it exits.
    if (!p.waitForFinished(-1) && p.state() != QProcess::NotRunning) {
        result.errorString = p.errorString();
        p.kill();
        p.waitForFinished(-1);
    }

    result.crashed  = p.exitStatus() != QProcess::NormalExit;
    result.exitCode = p.exitCode();
    if (!command.showStderr)
        result.standardError = p.readAllStandardError();

    log_debug(QString("Command %1 finished (exit %2%3)")
              .arg(command.display())
              .arg(result.exitCode)
              .arg(result.crashed ? QStringLiteral(", crashed") : QString())
              .toUtf8().constData());
    return result;
}

} // namespace pm::plugins
