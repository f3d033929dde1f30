#include "pilapse/frame_capture.hpp"

#include <utility>

#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QTime>

#include "pilapse/command_runner.hpp"
#include "pilapse/session_metrics.hpp"

namespace pilapse {

bool touchFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        return false;
    }
    file.close();
    return true;
}

CameraCapture::CameraCapture(const QString& program)
    : program_(program) {}

QString CameraCapture::name() const {
    return QFileInfo(program_).fileName();
}

QStringList CameraCapture::buildArguments(const QString& path) {
    return {
        "-n",
        "-o", path,
        "-w", QString::number(kWidth),
        "-h", QString::number(kHeight),
        "-q", QString::number(kQuality),
        "-t", QString::number(kShotTimeoutMs),
    };
}

void CameraCapture::captureTo(int sequence, const QString& path, const SessionLog& log) {
    const CommandResult result =
        CommandRunner::run(program_, buildArguments(path), kProcessTimeoutMs, log.path());
    if (result.timedOut) {
        log.warning(QString("Warning: %1 timed out on frame %2").arg(name()).arg(sequence));
    } else if (!result.success()) {
        log.warning(QString("Warning: %1 exited with code %2 on frame %3")
                        .arg(name())
                        .arg(result.exitCode)
                        .arg(sequence));
    }
}

PlaceholderCapture::PlaceholderCapture(const QString& program)
    : program_(program) {}

QString PlaceholderCapture::name() const {
    return QFileInfo(program_).fileName();
}

QStringList PlaceholderCapture::buildArguments(
    int sequence,
    const QString& timeOfDay,
    const QString& path) {
    return {
        "-size", QString("%1x%2").arg(CameraCapture::kWidth).arg(CameraCapture::kHeight),
        "-pointsize", "72",
        "-gravity", "center",
        QString("label:Frame %1\n%2").arg(sequence).arg(timeOfDay),
        path,
    };
}

void PlaceholderCapture::captureTo(int sequence, const QString& path, const SessionLog& log) {
    log.warning("Warning: no camera found, creating placeholder image");
    const QString now = QTime::currentTime().toString("HH:mm:ss");
    const CommandResult result =
        CommandRunner::run(program_, buildArguments(sequence, now, path), kTimeoutMs, log.path());
    if (!result.success()) {
        touchFile(path);
    }
}

void EmptyFileCapture::captureTo(int sequence, const QString& path, const SessionLog& log) {
    Q_UNUSED(sequence);
    log.warning("Warning: no camera or image generator found, creating empty frame");
    touchFile(path);
}

std::unique_ptr<CaptureBackend> makeCaptureBackend() {
    const QStringList cameraTools = {"raspistill", "libcamera-still", "rpicam-still"};
    for (const QString& tool : cameraTools) {
        const QString program = CommandRunner::findProgram(tool);
        if (!program.isEmpty()) {
            return std::make_unique<CameraCapture>(program);
        }
    }
    const QStringList generatorTools = {"convert", "magick"};
    for (const QString& tool : generatorTools) {
        const QString program = CommandRunner::findProgram(tool);
        if (!program.isEmpty()) {
            return std::make_unique<PlaceholderCapture>(program);
        }
    }
    return std::make_unique<EmptyFileCapture>();
}

FrameCaptureStage::FrameCaptureStage(std::unique_ptr<CaptureBackend> backend, const SessionLog& log)
    : backend_(std::move(backend)),
      log_(log) {}

Frame FrameCaptureStage::capture(int sequence, const QString& path) {
    QElapsedTimer elapsed;
    elapsed.start();
    backend_->captureTo(sequence, path, log_);

    Frame frame;
    frame.sequence = sequence;
    frame.path = path;
    frame.exists = QFileInfo::exists(path);
    frame.durationMs = elapsed.elapsed();

    SessionMetrics::instance().recordCapture(frame.exists, backend_->isPlaceholder(), frame.durationMs);
    return frame;
}

}  // namespace pilapse
