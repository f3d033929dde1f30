#include <gtest/gtest.h>

#include <QFileInfo>
#include <QTemporaryDir>

#include "fakes.hpp"
#include "pilapse/render_stage.hpp"
#include "pilapse/session.hpp"

using pilapse::fakes::FakeEncoder;

namespace pilapse {
namespace {

class RenderStageTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.isValid());
        SessionOptions options;
        options.baseDirOverride = dir_.path();
        options.totalFrames = 10;
        QString error;
        ASSERT_TRUE(SessionInitializer::create(options, &session_, &error)) << error.toStdString();
    }

    QTemporaryDir dir_;
    Session session_;
};

TEST_F(RenderStageTest, SuccessfulEncodeReturnsSessionScopedVideo) {
    auto encoder = std::make_unique<FakeEncoder>();
    FakeEncoder* fake = encoder.get();
    SessionLog log(session_.logFile);
    RenderStage stage(std::move(encoder), log);

    const RenderResult result = stage.render(session_, 6);
    EXPECT_EQ(result.outcome, RenderOutcome::Success);
    EXPECT_EQ(result.videoPath, session_.videoPath());
    EXPECT_TRUE(QFileInfo::exists(result.videoPath));
    EXPECT_EQ(fake->lastJob.frameCount, 6);
    EXPECT_EQ(fake->lastJob.framePattern, session_.framePattern());
    EXPECT_EQ(fake->lastJob.logFile, session_.logFile);
}

TEST_F(RenderStageTest, AbsentEncoderIsSkipped) {
    SessionLog log(session_.logFile);
    RenderStage stage(std::make_unique<MissingEncoder>(), log);

    const RenderResult result = stage.render(session_, 3);
    EXPECT_EQ(result.outcome, RenderOutcome::Skipped);
    EXPECT_TRUE(result.videoPath.isEmpty());
}

TEST_F(RenderStageTest, EncoderFailureIsReported) {
    auto encoder = std::make_unique<FakeEncoder>();
    encoder->succeed = false;
    SessionLog log(session_.logFile);
    RenderStage stage(std::move(encoder), log);

    const RenderResult result = stage.render(session_, 3);
    EXPECT_EQ(result.outcome, RenderOutcome::Failed);
    EXPECT_TRUE(result.videoPath.isEmpty());
}

TEST_F(RenderStageTest, FfmpegFailureFromRealProcessIsReported) {
    SessionLog log(session_.logFile);
    RenderStage stage(std::make_unique<FfmpegEncoder>("/bin/false"), log);

    EXPECT_EQ(stage.render(session_, 2).outcome, RenderOutcome::Failed);
}

TEST(FfmpegEncoderTest, ArgumentsEncodeExactlyTheCapturedFrames) {
    EncodeJob job;
    job.framePattern = "/s/video_frames/frame_%04d.jpg";
    job.frameCount = 4;
    job.outputPath = "/s/video/timelapse_20261019_080503.mp4";

    const QStringList args = FfmpegEncoder::buildArguments(job);
    EXPECT_EQ(args.at(args.indexOf("-framerate") + 1), "30");
    EXPECT_EQ(args.at(args.indexOf("-start_number") + 1), "1");
    EXPECT_EQ(args.at(args.indexOf("-i") + 1), job.framePattern);
    EXPECT_EQ(args.at(args.indexOf("-frames:v") + 1), "4");
    EXPECT_EQ(args.at(args.indexOf("-c:v") + 1), "libx264");
    EXPECT_EQ(args.at(args.indexOf("-pix_fmt") + 1), "yuv420p");
    EXPECT_EQ(args.at(args.indexOf("-preset") + 1), "medium");
    EXPECT_EQ(args.at(args.indexOf("-crf") + 1), "23");
    EXPECT_EQ(args.last(), job.outputPath);
}

}  // namespace
}  // namespace pilapse
