// File: src/cli/console_prompter.h
#pragma once

#include <QTextStream>

#include "plugins/plugin.h"

namespace pm::cli {

// Numbered menu on the terminal; re-asks until the answer is in range.
class ConsolePrompter : public plugins::Prompter {
public:
    ConsolePrompter(QTextStream &in, QTextStream &out);

    int chooseOption(const QStringList &options, const QString &message) override;

private:
    QTextStream &m_in;
    QTextStream &m_out;
};

} // namespace pm::cli
