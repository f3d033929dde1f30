#pragma once

#include <memory>

#include <QString>

class QLockFile;

namespace pilapse {

// Exclusive lock on a base directory; rejects a second concurrent session.
class SessionLock {
public:
    explicit SessionLock(const QString& baseDir);
    ~SessionLock();

    SessionLock(const SessionLock&) = delete;
    SessionLock& operator=(const SessionLock&) = delete;

    bool tryAcquire(QString* error = nullptr);
    [[nodiscard]] bool isLocked() const;
    [[nodiscard]] const QString& path() const { return path_; }

private:
    QString path_;
    std::unique_ptr<QLockFile> lock_;
};

}  // namespace pilapse
