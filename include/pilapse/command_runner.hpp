#pragma once

#include <QString>
#include <QStringList>

namespace pilapse {

struct CommandResult {
    int exitCode = -1;
    QString stdoutText;
    QString stderrText;
    bool started = false;
    bool timedOut = false;

    [[nodiscard]] bool success() const { return started && !timedOut && exitCode == 0; }
};

class CommandRunner {
public:
    // A negative timeout waits for the program indefinitely. When
    // appendOutputTo is set, stdout and stderr go to the end of that file
    // instead of being captured.
    static CommandResult run(
        const QString& program,
        const QStringList& args = {},
        int timeoutMs = 3000,
        const QString& appendOutputTo = {});

    // Absolute path of an executable on PATH, or empty when absent.
    static QString findProgram(const QString& name);
};

}  // namespace pilapse
