#include "pilapse/video_encoder.hpp"

#include "pilapse/command_runner.hpp"

namespace pilapse {

FfmpegEncoder::FfmpegEncoder(const QString& program)
    : program_(program) {}

QStringList FfmpegEncoder::buildArguments(const EncodeJob& job) {
    return {
        "-nostdin",
        "-y",
        "-framerate", QString::number(kFrameRate),
        "-start_number", "1",
        "-i", job.framePattern,
        "-frames:v", QString::number(job.frameCount),
        "-c:v", "libx264",
        "-pix_fmt", "yuv420p",
        "-preset", "medium",
        "-crf", "23",
        job.outputPath,
    };
}

bool FfmpegEncoder::encode(const EncodeJob& job) {
    // No timeout: a large session can take a long time to encode on a Pi.
    const CommandResult result = CommandRunner::run(program_, buildArguments(job), -1, job.logFile);
    return result.success();
}

std::unique_ptr<VideoEncoder> makeVideoEncoder() {
    const QString program = CommandRunner::findProgram("ffmpeg");
    if (program.isEmpty()) {
        return std::make_unique<MissingEncoder>();
    }
    return std::make_unique<FfmpegEncoder>(program);
}

}  // namespace pilapse
