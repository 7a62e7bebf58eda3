#include <gtest/gtest.h>

#include "fakes.hpp"
#include "sacore/storage_monitor.hpp"

using namespace sacore;
using namespace sacore::testing;

namespace {

constexpr qint64 kWarning = 500 * kMiB;
constexpr qint64 kCritical = 200 * kMiB;

}  // namespace

TEST(StorageMonitor, EvaluateAppliesStrictThresholds) {
    StorageStatus status = StorageMonitor::evaluate(kWarning, kWarning, kCritical);
    EXPECT_FALSE(status.warning);
    EXPECT_FALSE(status.critical);

    status = StorageMonitor::evaluate(kWarning - 1, kWarning, kCritical);
    EXPECT_TRUE(status.warning);
    EXPECT_FALSE(status.critical);

    status = StorageMonitor::evaluate(kCritical - 1, kWarning, kCritical);
    EXPECT_TRUE(status.warning);
    EXPECT_TRUE(status.critical);
}

TEST(StorageMonitor, UnknownFreeSpaceIsNeitherWarningNorCritical) {
    const StorageStatus status = StorageMonitor::evaluate(std::nullopt, kWarning, kCritical);
    EXPECT_FALSE(status.freeBytes.has_value());
    EXPECT_FALSE(status.warning);
    EXPECT_FALSE(status.critical);
    EXPECT_EQ(status.warningThresholdBytes, kWarning);
    EXPECT_EQ(status.criticalThresholdBytes, kCritical);
}

TEST(StorageMonitor, ReportsEachCrossingOnce) {
    FakeFreeSpace freeSpace;
    Telemetry telemetry;
    StorageMonitor monitor(&freeSpace, kWarning, kCritical, &telemetry);

    QStringList crossings;
    int changes = 0;
    QObject::connect(&monitor, &StorageMonitor::thresholdCrossed, [&crossings](const QString& threshold, const StorageStatus&) {
        crossings.append(threshold);
    });
    QObject::connect(&monitor, &StorageMonitor::statusChanged, [&changes](const StorageStatus&) { ++changes; });

    freeSpace.value = 300 * kMiB;
    monitor.refresh();
    monitor.refresh();
    EXPECT_EQ(crossings, QStringList {"warning"});

    freeSpace.value = 100 * kMiB;
    monitor.refresh();
    monitor.refresh();
    EXPECT_EQ(crossings, (QStringList {"warning", "critical"}));

    freeSpace.value = 1024 * kMiB;
    monitor.refresh();
    freeSpace.value = 100 * kMiB;
    monitor.refresh();
    EXPECT_EQ(crossings, (QStringList {"warning", "critical", "warning", "critical"}));

    EXPECT_EQ(changes, 6);
    EXPECT_EQ(telemetry.counter("safety_audio_storage_threshold_crossed"), 4);
    EXPECT_TRUE(monitor.status().critical);
}

TEST(StorageMonitor, PollingRefreshesPeriodically) {
    FakeFreeSpace freeSpace;
    StorageMonitor monitor(&freeSpace, kWarning, kCritical);
    int changes = 0;
    QObject::connect(&monitor, &StorageMonitor::statusChanged, [&changes](const StorageStatus&) { ++changes; });

    monitor.startPolling(5);
    EXPECT_TRUE(monitor.isPolling());
    EXPECT_TRUE(waitUntil([&changes]() { return changes >= 2; }));
    monitor.stopPolling();
    EXPECT_FALSE(monitor.isPolling());
}
