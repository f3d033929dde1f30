#pragma once

#include <memory>

#include <QString>
#include <QStringList>

#include "pilapse/session_log.hpp"

namespace pilapse {

struct Frame {
    int sequence = 0;
    QString path;
    bool exists = false;
    qint64 durationMs = 0;
};

// A way of producing one image file. Selected once per session.
class CaptureBackend {
public:
    virtual ~CaptureBackend() = default;

    [[nodiscard]] virtual QString name() const = 0;
    [[nodiscard]] virtual bool isPlaceholder() const { return false; }
    virtual void captureTo(int sequence, const QString& path, const SessionLog& log) = 0;
};

// raspistill / libcamera-still / rpicam-still.
class CameraCapture final : public CaptureBackend {
public:
    static constexpr int kWidth = 1920;
    static constexpr int kHeight = 1080;
    static constexpr int kQuality = 85;
    static constexpr int kShotTimeoutMs = 1000;
    static constexpr int kProcessTimeoutMs = 10000;

    explicit CameraCapture(const QString& program);

    [[nodiscard]] QString name() const override;
    void captureTo(int sequence, const QString& path, const SessionLog& log) override;

    static QStringList buildArguments(const QString& path);

private:
    QString program_;
};

// ImageMagick label with the frame number and wall-clock time. Touches an
// empty file when the generator fails.
class PlaceholderCapture final : public CaptureBackend {
public:
    static constexpr int kTimeoutMs = 30000;

    explicit PlaceholderCapture(const QString& program);

    [[nodiscard]] QString name() const override;
    [[nodiscard]] bool isPlaceholder() const override { return true; }
    void captureTo(int sequence, const QString& path, const SessionLog& log) override;

    static QStringList buildArguments(int sequence, const QString& timeOfDay, const QString& path);

private:
    QString program_;
};

class EmptyFileCapture final : public CaptureBackend {
public:
    [[nodiscard]] QString name() const override { return "empty-file"; }
    [[nodiscard]] bool isPlaceholder() const override { return true; }
    void captureTo(int sequence, const QString& path, const SessionLog& log) override;
};

bool touchFile(const QString& path);

// Looks up a camera tool on PATH, then an image generator.
std::unique_ptr<CaptureBackend> makeCaptureBackend();

class FrameCaptureStage {
public:
    FrameCaptureStage(std::unique_ptr<CaptureBackend> backend, const SessionLog& log);

    // Runs the backend for one frame and checks that its file now exists.
    Frame capture(int sequence, const QString& path);

    [[nodiscard]] const CaptureBackend& backend() const { return *backend_; }

private:
    std::unique_ptr<CaptureBackend> backend_;
    const SessionLog& log_;
};

}  // namespace pilapse
