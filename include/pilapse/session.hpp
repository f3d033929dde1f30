#pragma once

#include <QDateTime>
#include <QString>

namespace pilapse {

struct SessionOptions {
    int intervalSeconds = 5;
    int totalFrames = 10;
    QString baseDirOverride;
    QString sharedMount = "/mnt/share";
    QString applicationDir;
    QDateTime startedAt;
};

// One capture-then-render run. All paths are absolute and fixed once the
// session has been created.
struct Session {
    QString id;
    QString baseDir;
    QString outputDir;
    QString framesDir;
    QString videoDir;
    QString logFile;
    QString statusFile;
    int totalFrames = 0;
    int intervalSeconds = 0;

    [[nodiscard]] QString framePath(int sequence) const;
    [[nodiscard]] QString framePattern() const;
    [[nodiscard]] QString videoPath() const;
};

class SessionInitializer {
public:
    static QString resolveBaseDirectory(const SessionOptions& options);
    static QString statusFilePath(const QString& baseDir);

    // Derives the session paths and creates the frame and video directories.
    static bool create(const SessionOptions& options, Session* session, QString* error);
};

QString frameFileName(int sequence);

}  // namespace pilapse
