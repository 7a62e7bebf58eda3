#include "sacore/recorder_events.hpp"

#include <exception>

#include "sacore/logging.hpp"

namespace sacore {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

QString eventName(const RecorderEvent& event) {
    return std::visit(
        Overloaded {
            [](const StartedEvent&) { return QStringLiteral("started"); },
            [](const SegmentSavedEvent&) { return QStringLiteral("segment_saved"); },
            [](const StateChangedEvent&) { return QStringLiteral("state_changed"); },
            [](const RecoveredEvent&) { return QStringLiteral("recovered"); },
            [](const StoppedEvent&) { return QStringLiteral("stopped"); },
            [](const ErrorEvent&) { return QStringLiteral("error"); },
        },
        event);
}

QJsonObject toJson(const RecorderEvent& event, qint64 nowMs) {
    QJsonObject out = std::visit(
        Overloaded {
            [nowMs](const StartedEvent& e) { return QJsonObject {{"session", toJson(e.session, nowMs)}}; },
            [](const SegmentSavedEvent& e) { return QJsonObject {{"recording", toJson(e.recording)}}; },
            [](const StateChangedEvent& e) {
                return QJsonObject {
                    {"session_id", e.sessionId},
                    {"previous", toString(e.previous)},
                    {"current", toString(e.current)},
                    {"reason", e.reason},
                    {"elapsed_ms", static_cast<double>(e.elapsedMs)},
                };
            },
            [](const RecoveredEvent& e) { return QJsonObject {{"recording", toJson(e.recording)}}; },
            [](const StoppedEvent& e) {
                return QJsonObject {{"reason", e.reason}, {"session_id", e.sessionId}};
            },
            [](const ErrorEvent& e) { return QJsonObject {{"error", toJson(e.error)}}; },
        },
        event);
    out.insert("event", eventName(event));
    return out;
}

int EventChannel::subscribe(Listener listener) {
    const int id = nextId_++;
    listeners_.append(qMakePair(id, std::move(listener)));
    return id;
}

void EventChannel::unsubscribe(int subscriptionId) {
    for (int i = 0; i < listeners_.size(); ++i) {
        if (listeners_.at(i).first == subscriptionId) {
            listeners_.removeAt(i);
            return;
        }
    }
}

void EventChannel::publish(const RecorderEvent& event) const {
    const auto snapshot = listeners_;
    for (const auto& entry : snapshot) {
        try {
            entry.second(event);
        } catch (const std::exception& error) {
            qCWarning(lcRecorder) << "Recorder event listener failed on" << eventName(event) << error.what();
        }
    }
}

}  // namespace sacore
