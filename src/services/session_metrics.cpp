#include "pilapse/session_metrics.hpp"

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>

#include "pilapse/command_runner.hpp"

namespace pilapse {

void DurationStats::add(qint64 durationMs) {
    ++count;
    totalMs += durationMs;
    maxMs = qMax(maxMs, durationMs);
}

QJsonObject DurationStats::toJson() const {
    return {
        {"count", static_cast<double>(count)},
        {"total_ms", static_cast<double>(totalMs)},
        {"max_ms", static_cast<double>(maxMs)},
        {"avg_ms", count > 0 ? static_cast<double>(totalMs) / static_cast<double>(count) : 0.0},
    };
}

SessionMetrics& SessionMetrics::instance() {
    static SessionMetrics metrics;
    return metrics;
}

void SessionMetrics::recordCapture(bool written, bool placeholder, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    capture_.duration.add(durationMs);
    if (!written) {
        ++capture_.failures;
        return;
    }
    ++capture_.frames;
    if (placeholder) {
        ++capture_.placeholderFrames;
    }
}

void SessionMetrics::recordRender(bool succeeded, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    ++render_.attempts;
    if (succeeded) {
        ++render_.successes;
    } else {
        ++render_.failures;
    }
    render_.duration.add(durationMs);
}

void SessionMetrics::recordRenderSkipped() {
    QMutexLocker lock(&mutex_);
    ++render_.skipped;
}

void SessionMetrics::recordCommand(const CommandResult& result, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    ++commands_.runs;
    if (!result.started) {
        ++commands_.startFailures;
        return;
    }
    if (result.timedOut) {
        ++commands_.timeouts;
    } else if (result.exitCode != 0) {
        ++commands_.nonZeroExits;
    }
    commands_.duration.add(durationMs);
}

void SessionMetrics::recordTransition(SessionState from, SessionState to, int captured) {
    QMutexLocker lock(&mutex_);
    Transition transition;
    transition.from = from;
    transition.to = to;
    transition.captured = captured;
    transition.at = QDateTime::currentDateTimeUtc();
    transitions_.append(transition);
}

void SessionMetrics::reset() {
    QMutexLocker lock(&mutex_);
    capture_ = CaptureStats{};
    render_ = RenderStats{};
    commands_ = CommandStats{};
    transitions_.clear();
}

CaptureStats SessionMetrics::capture() const {
    QMutexLocker lock(&mutex_);
    return capture_;
}

RenderStats SessionMetrics::render() const {
    QMutexLocker lock(&mutex_);
    return render_;
}

QVector<Transition> SessionMetrics::transitions() const {
    QMutexLocker lock(&mutex_);
    return transitions_;
}

QJsonObject SessionMetrics::toJson() const {
    QMutexLocker lock(&mutex_);
    QJsonArray transitions;
    for (const Transition& t : transitions_) {
        transitions.append(QJsonObject{
            {"from", stateName(t.from)},
            {"to", stateName(t.to)},
            {"captured", t.captured},
            {"timestamp_utc", t.at.toString(Qt::ISODate)},
        });
    }

    QJsonObject out;
    out.insert("capture", QJsonObject{
        {"frames", capture_.frames},
        {"placeholder_frames", capture_.placeholderFrames},
        {"failures", capture_.failures},
        {"duration", capture_.duration.toJson()},
    });
    out.insert("render", QJsonObject{
        {"attempts", render_.attempts},
        {"successes", render_.successes},
        {"failures", render_.failures},
        {"skipped", render_.skipped},
        {"duration", render_.duration.toJson()},
    });
    out.insert("commands", QJsonObject{
        {"runs", commands_.runs},
        {"start_failures", commands_.startFailures},
        {"timeouts", commands_.timeouts},
        {"non_zero_exits", commands_.nonZeroExits},
        {"duration", commands_.duration.toJson()},
    });
    out.insert("transitions", transitions);
    return out;
}

bool SessionMetrics::exportToFile(const QString& filePath, QString* error) const {
    const QByteArray payload = QJsonDocument(toJson()).toJson(QJsonDocument::Indented);

    if (!QFileInfo(filePath).absoluteDir().mkpath(".")) {
        if (error) {
            *error = QString("Cannot create directory for %1").arg(filePath);
        }
        return false;
    }
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }
    file.write(payload);
    if (!file.commit()) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }
    return true;
}

}  // namespace pilapse
