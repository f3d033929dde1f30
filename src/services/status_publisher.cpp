#include "pilapse/status_publisher.hpp"

#include <utility>

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

namespace pilapse {

StatusPublisher::StatusPublisher(const QString& statusFile)
    : path_(statusFile) {}

void StatusPublisher::setObserver(Observer observer) {
    observer_ = std::move(observer);
}

bool StatusPublisher::validate(const StatusRecord& record) {
    if (record.captured < 0 || record.captured > record.total) {
        lastError_ = QString("captured %1 is outside 0..%2").arg(record.captured).arg(record.total);
        return false;
    }
    if (record.captured < lastCaptured_) {
        lastError_ = QString("captured regressed from %1 to %2")
                         .arg(lastCaptured_)
                         .arg(record.captured);
        return false;
    }
    return true;
}

bool StatusPublisher::publish(const StatusRecord& record) {
    if (!validate(record)) {
        return false;
    }

    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly)) {
        lastError_ = QString("Failed to open %1: %2").arg(path_, file.errorString());
        return false;
    }
    file.write(QJsonDocument(record.toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        lastError_ = QString("Failed to replace %1: %2").arg(path_, file.errorString());
        return false;
    }

    lastError_.clear();
    lastCaptured_ = record.captured;
    ++publishCount_;
    if (observer_) {
        observer_(record);
    }
    return true;
}

bool StatusPublisher::read(const QString& statusFile, StatusRecord* record, QString* error) {
    QFile file(statusFile);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = parseError.errorString();
        }
        return false;
    }
    return StatusRecord::fromJson(doc.object(), record, error);
}

}  // namespace pilapse
