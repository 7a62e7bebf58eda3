#include <gtest/gtest.h>

#include <stdexcept>

#include "sacore/recorder_events.hpp"

using namespace sacore;

TEST(EventChannel, DeliversToEverySubscriberInOrder) {
    EventChannel channel;
    QStringList seen;
    channel.subscribe([&seen](const RecorderEvent& event) { seen.append("a:" + eventName(event)); });
    channel.subscribe([&seen](const RecorderEvent& event) { seen.append("b:" + eventName(event)); });

    channel.publish(StoppedEvent {"manual-stop", "s1"});
    EXPECT_EQ(seen, (QStringList {"a:stopped", "b:stopped"}));
}

TEST(EventChannel, ThrowingListenerDoesNotAffectOthers) {
    EventChannel channel;
    int delivered = 0;
    channel.subscribe([](const RecorderEvent&) { throw std::runtime_error("listener bug"); });
    channel.subscribe([&delivered](const RecorderEvent&) { ++delivered; });

    channel.publish(ErrorEvent {EngineError {ErrorCode::FinalizeFailed, "disk"}});
    EXPECT_EQ(delivered, 1);
}

TEST(EventChannel, UnsubscribeStopsDelivery) {
    EventChannel channel;
    int delivered = 0;
    const int id = channel.subscribe([&delivered](const RecorderEvent&) { ++delivered; });
    channel.publish(StoppedEvent {});
    channel.unsubscribe(id);
    channel.publish(StoppedEvent {});
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(channel.listenerCount(), 0);
}

TEST(EventChannel, ListenerMayUnsubscribeDuringPublish) {
    EventChannel channel;
    int delivered = 0;
    int id = 0;
    id = channel.subscribe([&](const RecorderEvent&) {
        ++delivered;
        channel.unsubscribe(id);
    });
    channel.publish(StoppedEvent {});
    channel.publish(StoppedEvent {});
    EXPECT_EQ(delivered, 1);
}

TEST(EventChannel, JsonCarriesVariantPayload) {
    Recording recording;
    recording.id = "safety-audio-1-2";
    recording.createdAtMs = 1000;
    recording.expiresAtMs = 2000;

    const QJsonObject saved = toJson(SegmentSavedEvent {recording}, 0);
    EXPECT_EQ(saved.value("event").toString(), "segment_saved");
    EXPECT_EQ(saved.value("recording").toObject().value("id").toString(), "safety-audio-1-2");

    const QJsonObject changed =
        toJson(StateChangedEvent {"s1", SessionState::Running, SessionState::Paused, "call", 1500}, 0);
    EXPECT_EQ(changed.value("previous").toString(), "running");
    EXPECT_EQ(changed.value("current").toString(), "paused");
    EXPECT_EQ(changed.value("elapsed_ms").toInt(), 1500);
}
