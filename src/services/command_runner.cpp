#include "pilapse/command_runner.hpp"

#include <QElapsedTimer>
#include <QFileInfo>
#include <QIODevice>
#include <QProcess>
#include <QStandardPaths>

#include "pilapse/session_metrics.hpp"

namespace pilapse {

CommandResult CommandRunner::run(
    const QString& program,
    const QStringList& args,
    int timeoutMs,
    const QString& appendOutputTo) {
    QProcess process;
    QElapsedTimer elapsed;
    elapsed.start();

    process.setStandardInputFile(QProcess::nullDevice());
    if (!appendOutputTo.isEmpty()) {
        process.setProcessChannelMode(QProcess::MergedChannels);
        process.setStandardOutputFile(appendOutputTo, QIODevice::Append);
    }
    process.start(program, args);

    CommandResult result;
    const int startTimeoutMs = timeoutMs < 0 ? 30000 : timeoutMs;
    if (!process.waitForStarted(startTimeoutMs)) {
        result.stderrText = "Failed to start process.";
        SessionMetrics::instance().recordCommand(result, elapsed.elapsed());
        return result;
    }
    result.started = true;

    if (!process.waitForFinished(timeoutMs < 0 ? -1 : timeoutMs)) {
        process.kill();
        process.waitForFinished(500);
        result.timedOut = true;
        result.stderrText = "Command timed out.";
        SessionMetrics::instance().recordCommand(result, elapsed.elapsed());
        return result;
    }

    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    if (appendOutputTo.isEmpty()) {
        result.stdoutText = QString::fromUtf8(process.readAllStandardOutput());
        result.stderrText = QString::fromUtf8(process.readAllStandardError());
    }
    SessionMetrics::instance().recordCommand(result, elapsed.elapsed());
    return result;
}

QString CommandRunner::findProgram(const QString& name) {
    if (name.contains('/')) {
        const QFileInfo info(name);
        return info.isFile() && info.isExecutable() ? info.absoluteFilePath() : QString();
    }
    return QStandardPaths::findExecutable(name);
}

}  // namespace pilapse
