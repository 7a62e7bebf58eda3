#pragma once

#include <QJsonObject>
#include <QPair>
#include <QString>
#include <QVector>

#include <functional>
#include <variant>

#include "sacore/types.hpp"

namespace sacore {

struct StartedEvent {
    Session session;
};

struct SegmentSavedEvent {
    Recording recording;
};

struct StateChangedEvent {
    QString sessionId;
    SessionState previous = SessionState::Idle;
    SessionState current = SessionState::Idle;
    QString reason;
    qint64 elapsedMs = 0;
};

struct RecoveredEvent {
    Recording recording;
};

struct StoppedEvent {
    QString reason;
    QString sessionId;
};

struct ErrorEvent {
    EngineError error;
};

using RecorderEvent = std::variant<
    StartedEvent,
    SegmentSavedEvent,
    StateChangedEvent,
    RecoveredEvent,
    StoppedEvent,
    ErrorEvent>;

QString eventName(const RecorderEvent& event);
QJsonObject toJson(const RecorderEvent& event, qint64 nowMs);

// Synchronous fan-out of recorder lifecycle events. A listener that throws
// is logged and does not affect delivery to the others.
class EventChannel {
public:
    using Listener = std::function<void(const RecorderEvent&)>;

    int subscribe(Listener listener);
    void unsubscribe(int subscriptionId);
    void publish(const RecorderEvent& event) const;

    [[nodiscard]] int listenerCount() const { return listeners_.size(); }

private:
    QVector<QPair<int, Listener>> listeners_;
    int nextId_ = 1;
};

}  // namespace sacore
