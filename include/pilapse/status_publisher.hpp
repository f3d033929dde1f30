#pragma once

#include <functional>

#include <QString>

#include "pilapse/status_record.hpp"

namespace pilapse {

// Sole writer of the status file. Each publish replaces the whole document
// atomically (temporary file + rename), so concurrent readers observe either
// the previous or the new record, never a partial one.
class StatusPublisher {
public:
    using Observer = std::function<void(const StatusRecord&)>;

    explicit StatusPublisher(const QString& statusFile);

    bool publish(const StatusRecord& record);
    void setObserver(Observer observer);

    [[nodiscard]] const QString& path() const { return path_; }
    [[nodiscard]] const QString& lastError() const { return lastError_; }
    [[nodiscard]] int publishCount() const { return publishCount_; }

    static bool read(const QString& statusFile, StatusRecord* record, QString* error = nullptr);

private:
    bool validate(const StatusRecord& record);

    QString path_;
    QString lastError_;
    Observer observer_;
    int lastCaptured_ = -1;
    int publishCount_ = 0;
};

}  // namespace pilapse
