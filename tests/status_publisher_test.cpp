#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "pilapse/status_publisher.hpp"

namespace pilapse {
namespace {

StatusRecord runningRecord(int captured, int total) {
    StatusRecord record;
    record.state = SessionState::Running;
    record.captured = captured;
    record.total = total;
    record.folder = "/data/timelapse_20261019_101500";
    return record;
}

TEST(StatusPublisherTest, OverwritesWholeDocument) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    StatusPublisher publisher(dir.filePath("timelapse_status.json"));

    StatusRecord done = runningRecord(2, 2);
    done.state = SessionState::Done;
    done.video = "/data/v.mp4";
    ASSERT_TRUE(publisher.publish(runningRecord(1, 2)));
    ASSERT_TRUE(publisher.publish(done));

    StatusRecord stopped = runningRecord(2, 2);
    stopped.state = SessionState::Stopped;
    ASSERT_TRUE(publisher.publish(stopped));

    StatusRecord read;
    ASSERT_TRUE(StatusPublisher::read(publisher.path(), &read));
    EXPECT_EQ(read.state, SessionState::Stopped);
    EXPECT_TRUE(read.video.isEmpty());
    EXPECT_EQ(publisher.publishCount(), 3);

    EXPECT_EQ(QDir(dir.path()).entryList(QDir::Files), QStringList{"timelapse_status.json"});
}

TEST(StatusPublisherTest, RejectsCapturedRegressionAndOverflow) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    StatusPublisher publisher(dir.filePath("status.json"));

    ASSERT_TRUE(publisher.publish(runningRecord(3, 5)));
    EXPECT_FALSE(publisher.publish(runningRecord(2, 5)));
    EXPECT_TRUE(publisher.lastError().contains("regressed"));
    EXPECT_FALSE(publisher.publish(runningRecord(6, 5)));

    StatusRecord read;
    ASSERT_TRUE(StatusPublisher::read(publisher.path(), &read));
    EXPECT_EQ(read.captured, 3);
}

TEST(StatusPublisherTest, ReportsUnwritableLocation) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    StatusPublisher publisher(dir.filePath("missing/sub/dir/status.json"));

    EXPECT_FALSE(publisher.publish(runningRecord(0, 1)));
    EXPECT_FALSE(publisher.lastError().isEmpty());
}

TEST(StatusPublisherTest, ObserverSeesEveryPublishedRecord) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    StatusPublisher publisher(dir.filePath("status.json"));
    int seen = 0;
    publisher.setObserver([&seen](const StatusRecord& record) {
        EXPECT_EQ(record.captured, seen);
        ++seen;
    });

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(publisher.publish(runningRecord(i, 4)));
    }
    EXPECT_EQ(seen, 4);
}

TEST(StatusPublisherTest, ConcurrentReadersNeverSeeTornDocument) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("status.json");
    StatusPublisher publisher(path);
    ASSERT_TRUE(publisher.publish(runningRecord(0, 400)));

    std::atomic<bool> writing{true};
    std::atomic<int> invalid{0};
    std::atomic<int> reads{0};
    std::thread reader([&]() {
        do {
            StatusRecord record;
            if (!StatusPublisher::read(path, &record)) {
                invalid.fetch_add(1);
            }
            reads.fetch_add(1);
        } while (writing.load());
    });

    for (int i = 1; i <= 400; ++i) {
        StatusRecord record = runningRecord(i, 400);
        record.folder = QString(200, QChar('x'));
        EXPECT_TRUE(publisher.publish(record));
    }
    writing.store(false);
    reader.join();

    EXPECT_GT(reads.load(), 0);
    EXPECT_EQ(invalid.load(), 0);
}

}  // namespace
}  // namespace pilapse
