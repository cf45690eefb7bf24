// File: src/plugins/command_executor.h
#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <string>
#include <vector>

namespace pm::plugins {

// One entry of the command plugin's list.
struct CommandDescriptor {
    // Exactly one of these is used: a shell string, or an argv vector run
    // without a shell.
    bool useShell = true;
    std::string shellCommand;
    std::vector<std::string> argv;

    bool allowStdin = false;        // otherwise stdin is the null device
    bool showStdout = false;        // otherwise discarded
    bool showStderr = true;         // otherwise captured for the warning
    bool warningOnFailure = true;

    // Human-readable form for diagnostics.
    QString display() const;
    bool operator==(const CommandDescriptor &other) const;
};

struct ExecutionResult {
    bool started = false;           // false: the process could not be spawned
    QString errorString;            // why it could not be spawned
    bool crashed = false;           // terminated by a signal
    int exitCode = -1;
    QByteArray standardError;       // only filled when stderr was hidden

    bool succeeded() const { return started && !crashed && exitCode == 0; }
};

// Runs a single external program and waits for it, without timeout.
// Each command inherits the privileges of the invoking process.
class CommandExecutor {
public:
    explicit CommandExecutor(QString shell = QStringLiteral("/bin/sh"));

    ExecutionResult run(const CommandDescriptor &command) const;

    const QString &shell() const { return m_shell; }

private:
    QString m_shell;
};

} // namespace pm::plugins
