#pragma once

#include <memory>

#include <QString>
#include <QStringList>

namespace pilapse {

struct EncodeJob {
    QString framePattern;
    int frameCount = 0;
    QString outputPath;
    QString logFile;
};

class VideoEncoder {
public:
    virtual ~VideoEncoder() = default;

    [[nodiscard]] virtual QString name() const = 0;
    [[nodiscard]] virtual bool available() const = 0;
    virtual bool encode(const EncodeJob& job) = 0;
};

class FfmpegEncoder final : public VideoEncoder {
public:
    static constexpr int kFrameRate = 30;

    explicit FfmpegEncoder(const QString& program);

    [[nodiscard]] QString name() const override { return "ffmpeg"; }
    [[nodiscard]] bool available() const override { return true; }
    bool encode(const EncodeJob& job) override;

    static QStringList buildArguments(const EncodeJob& job);

private:
    QString program_;
};

class MissingEncoder final : public VideoEncoder {
public:
    [[nodiscard]] QString name() const override { return "none"; }
    [[nodiscard]] bool available() const override { return false; }
    bool encode(const EncodeJob&) override { return false; }
};

std::unique_ptr<VideoEncoder> makeVideoEncoder();

}  // namespace pilapse
