#include <gtest/gtest.h>

#include "sacore/reconciliation.hpp"

using namespace sacore;

TEST(Reconciliation, NoContextsAndNoOverridesStaysOff) {
    const Evaluation evaluation = evaluateDesiredState({}, {}, true);
    EXPECT_FALSE(evaluation.shouldRecord);
    EXPECT_TRUE(evaluation.contextKeys.isEmpty());
}

TEST(Reconciliation, AutoDefaultRecordsWhileAContextIsActive) {
    EXPECT_TRUE(evaluateDesiredState({"booking:42"}, {}, true).shouldRecord);
    EXPECT_FALSE(evaluateDesiredState({"booking:42"}, {}, false).shouldRecord);
}

TEST(Reconciliation, BookingLifecycleWithOverrides) {
    Evaluation evaluation = evaluateDesiredState({"booking:42"}, {}, true);
    EXPECT_TRUE(evaluation.shouldRecord);
    EXPECT_EQ(evaluation.contextKeys, QStringList {"booking:42"});

    evaluation = evaluateDesiredState({"booking:42"}, {{"booking:42", OverrideState::ForceOff}}, true);
    EXPECT_FALSE(evaluation.shouldRecord);
    EXPECT_EQ(evaluation.contextKeys, QStringList {"booking:42"});

    evaluation = evaluateDesiredState({}, {{kManualContextKey, OverrideState::ForceOn}}, true);
    EXPECT_TRUE(evaluation.shouldRecord);
    EXPECT_EQ(evaluation.contextKeys, QStringList {kManualContextKey});
}

TEST(Reconciliation, ForceOffDominatesForceOn) {
    const OverrideMap overrides {
        {"booking:1", OverrideState::ForceOn},
        {"booking:2", OverrideState::ForceOff},
    };
    const Evaluation evaluation = evaluateDesiredState({"booking:1", "booking:2"}, overrides, true);
    EXPECT_FALSE(evaluation.shouldRecord);
    EXPECT_EQ(evaluation.contextKeys, (QStringList {"booking:1", "booking:2"}));
}

TEST(Reconciliation, ForceOnCountsEvenForInactiveKeys) {
    const Evaluation evaluation = evaluateDesiredState({}, {{"booking:9", OverrideState::ForceOn}}, false);
    EXPECT_TRUE(evaluation.shouldRecord);
    EXPECT_EQ(evaluation.contextKeys, QStringList {"booking:9"});
}

TEST(Reconciliation, ForceOffOnInactiveKeyIsIgnored) {
    const OverrideMap overrides {
        {"booking:old", OverrideState::ForceOff},
    };
    const Evaluation evaluation = evaluateDesiredState({"booking:new"}, overrides, true);
    EXPECT_TRUE(evaluation.shouldRecord);
    EXPECT_EQ(evaluation.contextKeys, QStringList {"booking:new"});
}

TEST(Reconciliation, ManualForceOffCountsWithoutActiveContexts) {
    const OverrideMap overrides {
        {kManualContextKey, OverrideState::ForceOff},
        {"booking:7", OverrideState::ForceOn},
    };
    const Evaluation evaluation = evaluateDesiredState({}, overrides, true);
    EXPECT_FALSE(evaluation.shouldRecord);
    EXPECT_EQ(evaluation.contextKeys, (QStringList {"booking:7", kManualContextKey}));
}

TEST(Reconciliation, CandidatesKeepActiveOrderAndDropBlanksAndDuplicates) {
    const OverrideMap overrides {
        {"booking:b", OverrideState::ForceOn},
    };
    const Evaluation evaluation =
        evaluateDesiredState({"live_location:c", "", "booking:b", "live_location:c"}, overrides, false);
    EXPECT_EQ(evaluation.contextKeys, (QStringList {"live_location:c", "booking:b"}));
    EXPECT_TRUE(evaluation.shouldRecord);
}

TEST(Reconciliation, EvaluationIsDeterministic) {
    const OverrideMap overrides {
        {"booking:1", OverrideState::ForceOn},
        {kManualContextKey, OverrideState::ForceOff},
    };
    const QStringList active {"booking:1", "live_location:2"};
    EXPECT_EQ(evaluateDesiredState(active, overrides, true), evaluateDesiredState(active, overrides, true));
}

TEST(Reconciliation, DeriveActiveContextKeysFiltersStatusAndExpiry) {
    const qint64 now = 1000000;
    const QVector<BookingSession> bookings {
        {"42", "active"},
        {"43", "completed"},
        {"42", "active"},
    };
    const QVector<LocationShare> shares {
        {"c1", "active", now + 60000},
        {"c2", "active", now},
        {"c3", "stopped", now + 60000},
    };
    EXPECT_EQ(deriveActiveContextKeys(bookings, shares, now), (QStringList {"booking:42", "live_location:c1"}));
}

TEST(Reconciliation, ResolveDescriptorMapsKeyPrefixes) {
    ContextDescriptor descriptor = resolveDescriptor("booking:42");
    EXPECT_EQ(descriptor.contextType, ContextType::Booking);
    EXPECT_EQ(descriptor.contextId, "42");
    EXPECT_EQ(descriptor.source, RecordingSource::AutoBooking);

    descriptor = resolveDescriptor("live_location:conv-1");
    EXPECT_EQ(descriptor.contextType, ContextType::LiveLocation);
    EXPECT_EQ(descriptor.contextId, "conv-1");
    EXPECT_EQ(descriptor.source, RecordingSource::AutoLiveLocation);

    descriptor = resolveDescriptor(kManualContextKey);
    EXPECT_EQ(descriptor.contextType, ContextType::Manual);
    EXPECT_TRUE(descriptor.contextId.isEmpty());
    EXPECT_EQ(descriptor.source, RecordingSource::Manual);
}

TEST(Reconciliation, PruneKeepsForceOnAndActiveKeys) {
    const OverrideMap overrides {
        {"booking:1", OverrideState::ForceOff},
        {"booking:2", OverrideState::ForceOff},
        {"booking:3", OverrideState::ForceOn},
        {kManualContextKey, OverrideState::ForceOff},
    };

    OverrideMap pruned = pruneOverrides(overrides, {"booking:1"});
    EXPECT_TRUE(pruned.contains("booking:1"));
    EXPECT_FALSE(pruned.contains("booking:2"));
    EXPECT_TRUE(pruned.contains("booking:3"));
    EXPECT_TRUE(pruned.contains(kManualContextKey));

    pruned = pruneOverrides(overrides, {});
    EXPECT_EQ(pruned.keys(), QStringList {"booking:3"});
}

TEST(Reconciliation, PreferredStartKeyFavoursForceOn) {
    const OverrideMap overrides {
        {"live_location:c", OverrideState::ForceOn},
    };
    Evaluation evaluation;
    evaluation.shouldRecord = true;
    evaluation.contextKeys = {"booking:1", "live_location:c"};
    EXPECT_EQ(preferredStartKey(evaluation, overrides), "live_location:c");
    EXPECT_EQ(preferredStartKey(evaluation, {}), "booking:1");
    EXPECT_EQ(preferredStartKey(Evaluation {}, {}), kManualContextKey);
}
