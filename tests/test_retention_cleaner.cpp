#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "sacore/recording_store.hpp"
#include "sacore/retention_cleaner.hpp"

using namespace sacore;
using namespace sacore::testing;

namespace {

constexpr qint64 kWeekMs = 7LL * 24 * 60 * 60 * 1000;

class RetentionCleanerTest : public ::testing::Test {
protected:
    RetentionCleanerTest()
        : store_(dir_.filePath("root"), kWeekMs),
          cleaner_(&store_, &clock_, &telemetry_) {}

    Recording persist(qint64 createdAtMs) {
        const auto target = store_.allocateSegment("s", createdAtMs);
        writeFile(target->path, QByteArray(16, 'x'));
        return *store_.persistSegment(*target, 1000, ContextDescriptor {});
    }

    QTemporaryDir dir_;
    ManualClock clock_;
    Telemetry telemetry_;
    RecordingStore store_;
    RetentionCleaner cleaner_;
};

}  // namespace

TEST_F(RetentionCleanerTest, DeletesRecordingsAtOrPastExpiry) {
    const qint64 now = clock_.nowMs();
    const Recording expired = persist(now - kWeekMs - 1);
    const Recording boundary = persist(now - kWeekMs);
    const Recording fresh = persist(now - kWeekMs + 1);

    const CleanupResult result = cleaner_.runPass();
    EXPECT_EQ(result.deletedExpiredCount, 2);
    EXPECT_EQ(result.removedMissingCount, 0);
    ASSERT_EQ(result.remaining.size(), 1);
    EXPECT_EQ(result.remaining.first().id, fresh.id);
    EXPECT_FALSE(QFileInfo::exists(expired.path));
    EXPECT_FALSE(QFileInfo::exists(boundary.path));
    EXPECT_TRUE(QFileInfo::exists(fresh.path));
}

TEST_F(RetentionCleanerTest, PrunesEntriesWhoseFilesVanished) {
    const Recording gone = persist(clock_.nowMs());
    persist(clock_.nowMs());
    ASSERT_TRUE(QFile::remove(gone.path));

    const CleanupResult result = cleaner_.runPass();
    EXPECT_EQ(result.deletedExpiredCount, 0);
    EXPECT_EQ(result.removedMissingCount, 1);
    EXPECT_EQ(result.remaining.size(), 1);
}

TEST_F(RetentionCleanerTest, ReportsEveryPass) {
    int passes = 0;
    QObject::connect(&cleaner_, &RetentionCleaner::passCompleted, [&passes](int, int) { ++passes; });
    cleaner_.runPass();
    cleaner_.runPass();
    EXPECT_EQ(passes, 2);
    EXPECT_EQ(telemetry_.counter("safety_audio_cleanup_run"), 2);
}

TEST_F(RetentionCleanerTest, ScheduledPassesRun) {
    int passes = 0;
    QObject::connect(&cleaner_, &RetentionCleaner::passCompleted, [&passes](int, int) { ++passes; });
    cleaner_.startSchedule(5);
    EXPECT_TRUE(cleaner_.isScheduled());
    EXPECT_TRUE(waitUntil([&passes]() { return passes >= 2; }));
    cleaner_.stopSchedule();
    EXPECT_FALSE(cleaner_.isScheduled());
}
