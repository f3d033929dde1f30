#include "pilapse/timelapse_controller.hpp"

#include <chrono>
#include <utility>

#include <signal.h>

#include <QDir>

#include "pilapse/session_metrics.hpp"

namespace pilapse {

namespace {

QString signalName(int signalNumber) {
    switch (signalNumber) {
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    default:
        return {};
    }
}

}  // namespace

TimelapseController::TimelapseController(
    const Session& session,
    std::unique_ptr<CaptureBackend> capture,
    std::unique_ptr<VideoEncoder> encoder,
    const CancellationToken& cancel)
    : session_(session),
      log_(session.logFile),
      publisher_(session.statusFile),
      capture_(std::move(capture), log_),
      render_(std::move(encoder), log_),
      cancel_(cancel) {
    record_.total = session_.totalFrames;
    record_.folder = session_.outputDir;
}

void TimelapseController::publish() {
    if (!publisher_.publish(record_)) {
        log_.warning(QString("Warning: could not publish status: %1").arg(publisher_.lastError()));
    }
}

bool TimelapseController::transition(SessionState state) {
    if (isTerminal(record_.state)) {
        log_.warning(QString("Warning: ignoring %1 after terminal state %2")
                         .arg(stateName(state), stateName(record_.state)));
        return false;
    }
    if (record_.state != state) {
        SessionMetrics::instance().recordTransition(record_.state, state, record_.captured);
    }
    record_.state = state;
    publish();
    return true;
}

void TimelapseController::begin() {
    log_.append(QString("Starting timelapse: %1 frames at %2 second intervals")
                    .arg(session_.totalFrames)
                    .arg(session_.intervalSeconds));
    log_.append(QString("Capture backend: %1, encoder: %2")
                    .arg(capture_.backend().name(), render_.encoder().name()));
    record_.captured = 0;
    record_.video.clear();
    record_.error = QString();
    transition(SessionState::Running);
}

int TimelapseController::run() {
    begin();

    const auto interval = std::chrono::seconds(session_.intervalSeconds);
    for (int sequence = 1; sequence <= session_.totalFrames; ++sequence) {
        if (cancel_.isRequested()) {
            return finishInterrupted();
        }

        log_.append(QString("Capturing frame %1/%2").arg(sequence).arg(session_.totalFrames));
        const Frame frame = capture_.capture(sequence, session_.framePath(sequence));
        if (!frame.exists) {
            if (cancel_.isRequested()) {
                // The capture tool received the same signal and was cut short.
                log_.warning(QString("Frame %1 interrupted before it was written").arg(sequence));
                return finishInterrupted();
            }
            log_.warning(QString("Error: Failed to capture frame %1").arg(sequence));
            return fail(QString("Failed to capture frame %1").arg(sequence));
        }

        record_.captured = sequence;
        publish();

        if (session_.intervalSeconds > 0
            && frame.durationMs > std::chrono::duration_cast<std::chrono::milliseconds>(interval).count()) {
            log_.warning(QString("Warning: capture of frame %1 took longer than the interval").arg(sequence));
        }
        if (sequence < session_.totalFrames) {
            cancel_.waitFor(interval);
        }
    }

    if (cancel_.isRequested()) {
        return finishInterrupted();
    }
    log_.append("All frames captured, starting video rendering");
    return renderCaptured(false);
}

void TimelapseController::logInterrupt(const QString& when) {
    const QString name = signalName(cancel_.signalNumber());
    log_.append(QString("Received interrupt signal%1%2, cleaning up...")
                    .arg(name.isEmpty() ? QString() : QString(" (%1)").arg(name), when));
}

int TimelapseController::finishInterrupted() {
    logInterrupt({});
    if (record_.captured == 0) {
        record_.error = QString();
        transition(SessionState::Stopped);
        finish();
        return 0;
    }
    return renderCaptured(true);
}

int TimelapseController::renderCaptured(bool interrupted) {
    if (interrupted) {
        log_.append(QString("Creating video from %1 captured frames...").arg(record_.captured));
    }
    record_.error = QString();
    transition(SessionState::Rendering);

    const RenderResult result = render_.render(session_, record_.captured);
    // The encoder shares the terminal's process group, so a Ctrl-C during
    // the final encode usually makes it fail as well.
    const bool stopped = interrupted || cancel_.isRequested();
    if (stopped && !interrupted) {
        logInterrupt(" during rendering");
    }
    const SessionState success = stopped ? SessionState::Stopped : SessionState::Done;
    int exitCode = 0;
    switch (result.outcome) {
    case RenderOutcome::Success:
        record_.video = result.videoPath;
        record_.error = QString();
        transition(success);
        break;
    case RenderOutcome::Skipped:
        record_.error = "ffmpeg not available";
        transition(success);
        break;
    case RenderOutcome::Failed:
        record_.error = "Failed to create video";
        transition(stopped ? SessionState::Stopped : SessionState::Error);
        exitCode = stopped ? 0 : 1;
        break;
    }

    if (!stopped && exitCode == 0) {
        log_.append("Timelapse complete!");
    }
    finish();
    return exitCode;
}

int TimelapseController::fail(const QString& message) {
    record_.error = message;
    transition(SessionState::Error);
    finish();
    return 1;
}

void TimelapseController::finish() {
    QString error;
    const QString path = QDir(session_.outputDir).filePath("metrics.json");
    if (!SessionMetrics::instance().exportToFile(path, &error)) {
        log_.warning(QString("Warning: could not write %1: %2").arg(path, error));
    }
}

}  // namespace pilapse
