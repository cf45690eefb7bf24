// File: src/cli/console_prompter.cpp
#include "console_prompter.h"
#include "core/error.h"

namespace pm::cli {

ConsolePrompter::ConsolePrompter(QTextStream &in, QTextStream &out)
    : m_in(in), m_out(out) {}

int ConsolePrompter::chooseOption(const QStringList &options, const QString &message) {
    if (options.isEmpty())
        throw ConfigError("nothing to choose from");

    m_out << message << '\n';
    for (int i = 0; i < options.size(); ++i)
        m_out << QStringLiteral("  (%1) - %2").arg(i + 1).arg(options.at(i)) << '\n';

    const int top = static_cast<int>(options.size());
    for (;;) {
        m_out << QStringLiteral("1 - %1 > ").arg(top);
        m_out.flush();

        QString line;
        if (!m_in.readLineInto(&line))
            throw ConfigError("no answer (end of input)");

        bool ok = false;
        const int n = line.trimmed().toInt(&ok);
        if (ok && n >= 1 && n <= top)
            return n - 1;
        m_out << QStringLiteral("Input must be an integer between 1 and %1!").arg(top) << '\n';
    }
}

} // namespace pm::cli
