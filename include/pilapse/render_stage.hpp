#pragma once

#include <memory>

#include <QString>

#include "pilapse/session.hpp"
#include "pilapse/session_log.hpp"
#include "pilapse/video_encoder.hpp"

namespace pilapse {

enum class RenderOutcome {
    Skipped,
    Failed,
    Success,
};

struct RenderResult {
    RenderOutcome outcome = RenderOutcome::Failed;
    QString videoPath;
    qint64 durationMs = 0;
};

class RenderStage {
public:
    RenderStage(std::unique_ptr<VideoEncoder> encoder, const SessionLog& log);

    // Encodes frames 1..capturedCount of the session. Callers skip this
    // entirely when nothing was captured.
    RenderResult render(const Session& session, int capturedCount);

    [[nodiscard]] const VideoEncoder& encoder() const { return *encoder_; }

private:
    std::unique_ptr<VideoEncoder> encoder_;
    const SessionLog& log_;
};

}  // namespace pilapse
