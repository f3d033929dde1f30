#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QMutex>
#include <QString>
#include <QVector>

#include "pilapse/status_record.hpp"

namespace pilapse {

struct CommandResult;

struct DurationStats {
    qint64 count = 0;
    qint64 totalMs = 0;
    qint64 maxMs = 0;

    void add(qint64 durationMs);
    [[nodiscard]] QJsonObject toJson() const;
};

struct CaptureStats {
    int frames = 0;
    int placeholderFrames = 0;
    int failures = 0;
    DurationStats duration;
};

struct RenderStats {
    int attempts = 0;
    int successes = 0;
    int failures = 0;
    int skipped = 0;
    DurationStats duration;
};

struct CommandStats {
    int runs = 0;
    int startFailures = 0;
    int timeouts = 0;
    int nonZeroExits = 0;
    DurationStats duration;
};

struct Transition {
    SessionState from = SessionState::Idle;
    SessionState to = SessionState::Idle;
    int captured = 0;
    QDateTime at;
};

// Capture, render and external command statistics of the running session,
// exported next to its log when the session ends.
class SessionMetrics final {
public:
    static SessionMetrics& instance();

    void recordCapture(bool written, bool placeholder, qint64 durationMs);
    void recordRender(bool succeeded, qint64 durationMs);
    void recordRenderSkipped();
    void recordCommand(const CommandResult& result, qint64 durationMs);
    void recordTransition(SessionState from, SessionState to, int captured);
    void reset();

    [[nodiscard]] CaptureStats capture() const;
    [[nodiscard]] RenderStats render() const;
    [[nodiscard]] QVector<Transition> transitions() const;

    [[nodiscard]] QJsonObject toJson() const;
    bool exportToFile(const QString& filePath, QString* error = nullptr) const;

private:
    SessionMetrics() = default;

    mutable QMutex mutex_;
    CaptureStats capture_;
    RenderStats render_;
    CommandStats commands_;
    QVector<Transition> transitions_;
};

}  // namespace pilapse
