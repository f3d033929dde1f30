#include "pilapse/status_record.hpp"

#include <QJsonValue>

namespace pilapse {

namespace {

struct StateName {
    SessionState state;
    const char* name;
};

constexpr StateName kStateNames[] = {
    {SessionState::Idle, "idle"},
    {SessionState::Running, "running"},
    {SessionState::Rendering, "rendering"},
    {SessionState::Done, "done"},
    {SessionState::Stopped, "stopped"},
    {SessionState::Error, "error"},
};

bool fail(QString* error, const QString& message) {
    if (error) {
        *error = message;
    }
    return false;
}

}  // namespace

QString stateName(SessionState state) {
    for (const StateName& entry : kStateNames) {
        if (entry.state == state) {
            return QString::fromLatin1(entry.name);
        }
    }
    return "idle";
}

bool parseState(const QString& name, SessionState* state) {
    for (const StateName& entry : kStateNames) {
        if (name == QLatin1String(entry.name)) {
            *state = entry.state;
            return true;
        }
    }
    return false;
}

bool isTerminal(SessionState state) {
    return state == SessionState::Done
        || state == SessionState::Stopped
        || state == SessionState::Error;
}

QJsonObject StatusRecord::toJson() const {
    QJsonObject out;
    out.insert("status", stateName(state));
    out.insert("captured", captured);
    out.insert("total", total);
    out.insert("folder", folder);
    if (!video.isEmpty()) {
        out.insert("video", video);
    }
    out.insert("error", error.isNull() ? QJsonValue(QJsonValue::Null) : QJsonValue(error));
    return out;
}

bool StatusRecord::fromJson(const QJsonObject& json, StatusRecord* record, QString* error) {
    StatusRecord parsed;
    if (!json.value("status").isString()
        || !parseState(json.value("status").toString(), &parsed.state)) {
        return fail(error, "Missing or unknown \"status\".");
    }
    if (!json.value("captured").isDouble() || !json.value("total").isDouble()) {
        return fail(error, "Missing numeric \"captured\" or \"total\".");
    }
    parsed.captured = json.value("captured").toInt(-1);
    parsed.total = json.value("total").toInt(-1);
    if (parsed.captured < 0 || parsed.total < 0 || parsed.captured > parsed.total) {
        return fail(error, "\"captured\" is outside 0..total.");
    }
    if (!json.value("folder").isString()) {
        return fail(error, "Missing \"folder\".");
    }
    parsed.folder = json.value("folder").toString();

    const QJsonValue video = json.value("video");
    if (video.isString()) {
        parsed.video = video.toString();
    } else if (!video.isUndefined() && !video.isNull()) {
        return fail(error, "\"video\" must be a string.");
    }

    const QJsonValue err = json.value("error");
    if (err.isString()) {
        parsed.error = err.toString();
    } else if (!err.isNull()) {
        return fail(error, "\"error\" must be a string or null.");
    }

    *record = parsed;
    return true;
}

}  // namespace pilapse
