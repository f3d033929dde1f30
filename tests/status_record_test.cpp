#include <gtest/gtest.h>

#include <QJsonDocument>

#include "pilapse/status_record.hpp"

namespace pilapse {
namespace {

TEST(StatusRecordTest, RunningRecordHasNullErrorAndNoVideo) {
    StatusRecord record;
    record.state = SessionState::Running;
    record.captured = 3;
    record.total = 10;
    record.folder = "/mnt/share/timelapse_20261019_120000";

    const QJsonObject json = record.toJson();
    EXPECT_EQ(json.value("status").toString(), "running");
    EXPECT_EQ(json.value("captured").toInt(), 3);
    EXPECT_EQ(json.value("total").toInt(), 10);
    EXPECT_EQ(json.value("folder").toString(), record.folder);
    EXPECT_TRUE(json.value("error").isNull());
    EXPECT_FALSE(json.contains("video"));
    EXPECT_EQ(json.size(), 5);
}

TEST(StatusRecordTest, DoneRecordCarriesVideo) {
    StatusRecord record;
    record.state = SessionState::Done;
    record.captured = 10;
    record.total = 10;
    record.folder = "/tmp/t";
    record.video = "/tmp/t/video/timelapse_20261019_120000.mp4";

    const QJsonObject json = record.toJson();
    EXPECT_EQ(json.value("status").toString(), "done");
    EXPECT_EQ(json.value("video").toString(), record.video);

    StatusRecord parsed;
    ASSERT_TRUE(StatusRecord::fromJson(json, &parsed));
    EXPECT_EQ(parsed.state, SessionState::Done);
    EXPECT_EQ(parsed.video, record.video);
    EXPECT_TRUE(parsed.error.isNull());
}

TEST(StatusRecordTest, ParsesDocumentWrittenByShellScript) {
    const QByteArray text = R"({
        "status": "stopped",
        "captured": 4,
        "total": 10,
        "folder": "/mnt/share/timelapse_x",
        "error": "ffmpeg not available"
    })";
    StatusRecord record;
    QString error;
    ASSERT_TRUE(StatusRecord::fromJson(QJsonDocument::fromJson(text).object(), &record, &error))
        << error.toStdString();
    EXPECT_EQ(record.state, SessionState::Stopped);
    EXPECT_EQ(record.captured, 4);
    EXPECT_EQ(record.error, "ffmpeg not available");
    EXPECT_TRUE(record.video.isEmpty());
}

TEST(StatusRecordTest, RejectsInvalidDocuments) {
    StatusRecord record;
    QString error;
    EXPECT_FALSE(StatusRecord::fromJson(QJsonObject{{"status", "paused"}}, &record, &error));
    EXPECT_FALSE(error.isEmpty());

    const QJsonObject overflow{
        {"status", "running"}, {"captured", 11}, {"total", 10},
        {"folder", "/x"}, {"error", QJsonValue(QJsonValue::Null)},
    };
    EXPECT_FALSE(StatusRecord::fromJson(overflow, &record));

    const QJsonObject missingError{
        {"status", "running"}, {"captured", 1}, {"total", 10}, {"folder", "/x"},
    };
    EXPECT_FALSE(StatusRecord::fromJson(missingError, &record));
}

TEST(StatusRecordTest, StateNamesAndTerminality) {
    SessionState state = SessionState::Idle;
    for (const char* name : {"idle", "running", "rendering", "done", "stopped", "error"}) {
        ASSERT_TRUE(parseState(name, &state)) << name;
        EXPECT_EQ(stateName(state), QString(name));
    }
    EXPECT_FALSE(isTerminal(SessionState::Running));
    EXPECT_FALSE(isTerminal(SessionState::Rendering));
    EXPECT_TRUE(isTerminal(SessionState::Done));
    EXPECT_TRUE(isTerminal(SessionState::Stopped));
    EXPECT_TRUE(isTerminal(SessionState::Error));
}

}  // namespace
}  // namespace pilapse
