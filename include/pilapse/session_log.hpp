#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcSession)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

namespace pilapse {

// Append-only, timestamped event log of a session. Every line is also
// mirrored to the pilapse.session logging category.
class SessionLog {
public:
    explicit SessionLog(const QString& path);

    bool append(const QString& message) const;
    bool warning(const QString& message) const;

    [[nodiscard]] const QString& path() const { return path_; }

private:
    bool write(const QString& line) const;

    QString path_;
};

}  // namespace pilapse
