#include "pilapse/session.hpp"

#include <QDir>
#include <QFileInfo>

namespace pilapse {

namespace {

bool isWritableDirectory(const QString& path) {
    if (path.isEmpty()) {
        return false;
    }
    const QFileInfo info(path);
    return info.exists() && info.isDir() && info.isWritable();
}

}  // namespace

QString frameFileName(int sequence) {
    return QString("frame_%1.jpg").arg(sequence, 4, 10, QChar('0'));
}

QString Session::framePath(int sequence) const {
    return QDir(framesDir).filePath(frameFileName(sequence));
}

QString Session::framePattern() const {
    return QDir(framesDir).filePath("frame_%04d.jpg");
}

QString Session::videoPath() const {
    return QDir(videoDir).filePath(QString("timelapse_%1.mp4").arg(id));
}

QString SessionInitializer::resolveBaseDirectory(const SessionOptions& options) {
    if (!options.baseDirOverride.trimmed().isEmpty()) {
        return QDir(options.baseDirOverride.trimmed()).absolutePath();
    }
    if (isWritableDirectory(options.sharedMount)) {
        return QDir(options.sharedMount).absolutePath();
    }
    if (!options.applicationDir.isEmpty()) {
        return QDir(options.applicationDir).absolutePath();
    }
    return QDir::currentPath();
}

QString SessionInitializer::statusFilePath(const QString& baseDir) {
    return QDir(baseDir).filePath("timelapse_status.json");
}

bool SessionInitializer::create(const SessionOptions& options, Session* session, QString* error) {
    const QDateTime startedAt =
        options.startedAt.isValid() ? options.startedAt : QDateTime::currentDateTime();

    Session out;
    out.id = startedAt.toString("yyyyMMdd_HHmmss");
    out.baseDir = resolveBaseDirectory(options);
    out.totalFrames = options.totalFrames;
    out.intervalSeconds = options.intervalSeconds;

    const QDir base(out.baseDir);
    out.outputDir = base.filePath(QString("timelapse_%1").arg(out.id));
    out.framesDir = QDir(out.outputDir).filePath("video_frames");
    out.videoDir = QDir(out.outputDir).filePath("video");
    out.logFile = QDir(out.outputDir).filePath("timelapse.log");
    out.statusFile = statusFilePath(out.baseDir);

    for (const QString& dir : {out.framesDir, out.videoDir}) {
        if (!QDir().mkpath(dir)) {
            if (error) {
                *error = QString("Failed to create directory %1").arg(dir);
            }
            return false;
        }
    }

    *session = out;
    return true;
}

}  // namespace pilapse
