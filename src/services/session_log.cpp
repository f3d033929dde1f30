#include "pilapse/session_log.hpp"

#include <QDateTime>
#include <QFile>
#include <QTextStream>

Q_LOGGING_CATEGORY(lcSession, "pilapse.session")
Q_LOGGING_CATEGORY(lcApp, "pilapse.app")

namespace pilapse {

SessionLog::SessionLog(const QString& path)
    : path_(path) {}

bool SessionLog::append(const QString& message) const {
    qCInfo(lcSession).noquote() << message;
    return write(message);
}

bool SessionLog::warning(const QString& message) const {
    qCWarning(lcSession).noquote() << message;
    return write(message);
}

bool SessionLog::write(const QString& message) const {
    // Reopened per line: capture tools and the encoder append to the same file.
    QFile file(path_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    const QString stamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss");
    QTextStream out(&file);
    out << '[' << stamp << "] " << message << '\n';
    out.flush();
    return out.status() == QTextStream::Ok;
}

}  // namespace pilapse
