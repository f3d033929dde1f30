#pragma once

#include <memory>

#include "pilapse/frame_capture.hpp"
#include "pilapse/interrupt_handler.hpp"
#include "pilapse/render_stage.hpp"
#include "pilapse/session.hpp"
#include "pilapse/session_log.hpp"
#include "pilapse/status_publisher.hpp"
#include "pilapse/status_record.hpp"
#include "pilapse/video_encoder.hpp"

namespace pilapse {

// Drives one session: running -> rendering -> done/stopped/error. The status
// record lives here and is published on every transition.
class TimelapseController {
public:
    TimelapseController(
        const Session& session,
        std::unique_ptr<CaptureBackend> capture,
        std::unique_ptr<VideoEncoder> encoder,
        const CancellationToken& cancel);

    // Returns the process exit code.
    int run();

    [[nodiscard]] const StatusRecord& status() const { return record_; }
    [[nodiscard]] StatusPublisher& publisher() { return publisher_; }
    [[nodiscard]] const Session& session() const { return session_; }

private:
    void begin();
    int finishInterrupted();
    int renderCaptured(bool interrupted);
    int fail(const QString& message);
    void logInterrupt(const QString& when);
    bool transition(SessionState state);
    void publish();
    void finish();

    Session session_;
    SessionLog log_;
    StatusPublisher publisher_;
    FrameCaptureStage capture_;
    RenderStage render_;
    const CancellationToken& cancel_;
    StatusRecord record_;
};

}  // namespace pilapse
