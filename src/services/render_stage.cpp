#include "pilapse/render_stage.hpp"

#include <utility>

#include <QElapsedTimer>
#include <QFileInfo>

#include "pilapse/session_metrics.hpp"

namespace pilapse {

RenderStage::RenderStage(std::unique_ptr<VideoEncoder> encoder, const SessionLog& log)
    : encoder_(std::move(encoder)),
      log_(log) {}

RenderResult RenderStage::render(const Session& session, int capturedCount) {
    RenderResult result;
    if (!encoder_->available()) {
        log_.warning("Warning: ffmpeg not found, skipping video creation");
        result.outcome = RenderOutcome::Skipped;
        SessionMetrics::instance().recordRenderSkipped();
        return result;
    }
    if (capturedCount <= 0) {
        log_.warning("Error: no frames to render");
        SessionMetrics::instance().recordRender(false, 0);
        return result;
    }

    EncodeJob job;
    job.framePattern = session.framePattern();
    job.frameCount = capturedCount;
    job.outputPath = session.videoPath();
    job.logFile = session.logFile;

    log_.append(QString("Creating video with %1").arg(encoder_->name()));
    QElapsedTimer elapsed;
    elapsed.start();
    const bool encoded = encoder_->encode(job);
    result.durationMs = elapsed.elapsed();

    const bool produced = encoded && QFileInfo::exists(job.outputPath);
    SessionMetrics::instance().recordRender(produced, result.durationMs);
    if (!produced) {
        log_.warning("Error creating video");
        return result;
    }

    log_.append(QString("Video created successfully: %1").arg(job.outputPath));
    result.outcome = RenderOutcome::Success;
    result.videoPath = job.outputPath;
    return result;
}

}  // namespace pilapse
