#pragma once

#include <QJsonObject>
#include <QString>

namespace pilapse {

enum class SessionState {
    Idle,
    Running,
    Rendering,
    Done,
    Stopped,
    Error,
};

QString stateName(SessionState state);
bool parseState(const QString& name, SessionState* state);
bool isTerminal(SessionState state);

// Progress snapshot published to timelapse_status.json. An unset video is
// omitted from the document; a null error is written as JSON null.
struct StatusRecord {
    SessionState state = SessionState::Idle;
    int captured = 0;
    int total = 0;
    QString folder;
    QString video;
    QString error;

    [[nodiscard]] QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& json, StatusRecord* record, QString* error = nullptr);
};

}  // namespace pilapse
