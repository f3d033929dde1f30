#include "pilapse/session_lock.hpp"

#include <QDir>
#include <QLockFile>

namespace pilapse {

SessionLock::SessionLock(const QString& baseDir)
    : path_(QDir(baseDir).filePath("timelapse.lock")),
      lock_(std::make_unique<QLockFile>(path_)) {
    // A session can legitimately run for days; only dead owners are stale.
    lock_->setStaleLockTime(0);
}

SessionLock::~SessionLock() = default;

bool SessionLock::tryAcquire(QString* error) {
    if (lock_->tryLock(0)) {
        return true;
    }
    if (error) {
        qint64 pid = 0;
        QString host;
        QString app;
        if (lock_->error() == QLockFile::LockFailedError && lock_->getLockInfo(&pid, &host, &app)) {
            *error = QString("Another timelapse session is running (pid %1)").arg(pid);
        } else {
            *error = QString("Cannot create lock file %1").arg(path_);
        }
    }
    return false;
}

bool SessionLock::isLocked() const {
    return lock_->isLocked();
}

}  // namespace pilapse
