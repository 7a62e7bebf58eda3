#include "sacore/command_console.hpp"

#include <QIODevice>
#include <QJsonArray>
#include <QJsonDocument>
#include <QtNumeric>
#include <QSocketNotifier>

#include <unistd.h>

#include "sacore/clock.hpp"
#include "sacore/logging.hpp"
#include "sacore/permission_gate.hpp"
#include "sacore/recorder_events.hpp"
#include "sacore/safety_audio_controller.hpp"

namespace sacore {

namespace {

constexpr int kMaxShareMinutes = 7 * 24 * 60;

}  // namespace

CommandConsole::CommandConsole(
    SafetyAudioController* controller,
    EventChannel* events,
    PermissionGate* permission,
    const Clock* clock,
    QIODevice* output,
    QObject* parent)
    : QObject(parent),
      controller_(controller),
      events_(events),
      permission_(permission),
      clock_(clock),
      output_(output) {
    connect(controller_, &SafetyAudioController::noticeRaised, this, [this](const QString& title, const QString& message) {
        writeLine({{"notice", title}, {"message", message}});
    });
    if (events_ != nullptr) {
        eventSubscription_ = events_->subscribe([this](const RecorderEvent& event) {
            writeLine(toJson(event, clock_->nowMs()));
        });
    }
}

CommandConsole::~CommandConsole() {
    if (events_ != nullptr) {
        events_->unsubscribe(eventSubscription_);
    }
}

void CommandConsole::attachStdin() {
    if (stdinNotifier_ != nullptr) {
        return;
    }
    stdinNotifier_ = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(stdinNotifier_, &QSocketNotifier::activated, this, [this]() { readStdin(); });
}

void CommandConsole::readStdin() {
    char buffer[4096];
    const ssize_t count = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (count <= 0) {
        qCInfo(lcConsole) << "stdin closed, console input disabled";
        stdinNotifier_->setEnabled(false);
        return;
    }
    stdinBuffer_.append(buffer, static_cast<int>(count));
    int newline = stdinBuffer_.indexOf('\n');
    while (newline >= 0) {
        const QString line = QString::fromUtf8(stdinBuffer_.left(newline));
        stdinBuffer_.remove(0, newline + 1);
        handleLine(line);
        newline = stdinBuffer_.indexOf('\n');
    }
}

QStringList CommandConsole::tokenize(const QString& line) {
    return line.simplified().split(' ', Qt::SkipEmptyParts);
}

QString CommandConsole::helpText() {
    return "status | start [key] | stop [reason] | booking add|end <id> | share add <id> <minutes> | "
           "share end <id> | override <key> on|off|clear | auto on|off | foreground | recordings | "
           "delete <id> | cleanup | permission [settings] | quit";
}

void CommandConsole::handleLine(const QString& line) {
    const QStringList tokens = tokenize(line);
    if (tokens.isEmpty()) {
        return;
    }
    const QString command = tokens.first().toLower();
    const QStringList args = tokens.mid(1);
    qCDebug(lcConsole) << "Command:" << line.trimmed();

    if (command == "status") {
        respond(command, true, controller_->statusSnapshot());
    } else if (command == "start") {
        handleStart(args);
    } else if (command == "stop") {
        handleStop(args);
    } else if (command == "booking") {
        handleBooking(args);
    } else if (command == "share") {
        handleShare(args);
    } else if (command == "override") {
        handleOverride(args);
    } else if (command == "auto") {
        handleAuto(args);
    } else if (command == "foreground") {
        controller_->handleForeground();
        respond(command, true);
    } else if (command == "recordings") {
        handleRecordings();
    } else if (command == "delete") {
        handleDelete(args);
    } else if (command == "cleanup") {
        handleCleanup();
    } else if (command == "permission") {
        handlePermission(args);
    } else if (command == "help") {
        respond(command, true, {{"usage", helpText()}});
    } else if (command == "quit" || command == "exit") {
        respond(command, true);
        emit quitRequested();
    } else {
        respondError(command, "Unknown command. " + helpText());
    }
}

void CommandConsole::handleStart(const QStringList& args) {
    const QString key = args.isEmpty() ? kManualContextKey : args.first();
    controller_->startRecording(key).then(this, [this](const OperationResult& result) {
        if (result.success) {
            respond("start", true, controller_->statusSnapshot());
        } else {
            respondError("start", result.error);
        }
    });
}

void CommandConsole::handleStop(const QStringList& args) {
    const QString reason = args.isEmpty() ? QString("manual-stop") : args.first();
    controller_->stopRecording(reason).then(this, [this](const OperationResult& result) {
        respond("stop", result.success, controller_->statusSnapshot());
    });
}

void CommandConsole::handleBooking(const QStringList& args) {
    if (args.size() != 2 || (args.at(0) != "add" && args.at(0) != "end")) {
        respondError("booking", "Usage: booking add|end <id>");
        return;
    }
    const QString bookingId = args.at(1);
    if (args.at(0) == "add") {
        bookings_.insert(bookingId, BookingSession {bookingId, "active"});
    } else {
        bookings_.remove(bookingId);
    }
    pushBookings();
    respond("booking", true, {{"active_context_keys", QJsonArray::fromStringList(controller_->activeContextKeys())}});
}

void CommandConsole::handleShare(const QStringList& args) {
    if (args.size() == 3 && args.at(0) == "add") {
        bool ok = false;
        const double minutes = args.at(2).toDouble(&ok);
        if (!ok || !qIsFinite(minutes) || minutes <= 0 || minutes > kMaxShareMinutes) {
            respondError(
                "share",
                QString("Share duration must be a positive number of minutes, at most %1.").arg(kMaxShareMinutes));
            return;
        }
        const qint64 expiresAtMs = clock_->nowMs() + static_cast<qint64>(minutes * 60 * 1000);
        shares_.insert(args.at(1), LocationShare {args.at(1), "active", expiresAtMs});
    } else if (args.size() == 2 && args.at(0) == "end") {
        shares_.remove(args.at(1));
    } else {
        respondError("share", "Usage: share add <id> <minutes> | share end <id>");
        return;
    }
    pushShares();
    respond("share", true, {{"active_context_keys", QJsonArray::fromStringList(controller_->activeContextKeys())}});
}

void CommandConsole::handleOverride(const QStringList& args) {
    if (args.size() != 2) {
        respondError("override", "Usage: override <key> on|off|clear");
        return;
    }
    const QString mode = args.at(1);
    if (mode == "on") {
        controller_->setOverride(args.at(0), OverrideState::ForceOn);
    } else if (mode == "off") {
        controller_->setOverride(args.at(0), OverrideState::ForceOff);
    } else if (mode == "clear") {
        controller_->setOverride(args.at(0), std::nullopt);
    } else {
        respondError("override", "Override must be on, off or clear.");
        return;
    }
    respond("override", true, controller_->statusSnapshot());
}

void CommandConsole::handleAuto(const QStringList& args) {
    if (args.size() != 1 || (args.first() != "on" && args.first() != "off")) {
        respondError("auto", "Usage: auto on|off");
        return;
    }
    controller_->setAutoRecordDefault(args.first() == "on");
    respond("auto", true, {{"auto_record_default", controller_->autoRecordDefault()}});
}

void CommandConsole::handleRecordings() {
    QJsonArray rows;
    for (const Recording& recording : controller_->recordings()) {
        rows.append(toJson(recording));
    }
    respond("recordings", true, {{"recordings", rows}});
}

void CommandConsole::handleDelete(const QStringList& args) {
    if (args.size() != 1) {
        respondError("delete", "Usage: delete <id>");
        return;
    }
    if (!controller_->deleteRecording(args.first())) {
        respondError("delete", QString("Recording %1 was not found or could not be removed.").arg(args.first()));
        return;
    }
    respond("delete", true, {{"id", args.first()}});
}

void CommandConsole::handleCleanup() {
    const CleanupResult result = controller_->runRetentionCleanup();
    respond(
        "cleanup",
        true,
        {{"deleted_expired_count", result.deletedExpiredCount},
         {"removed_missing_count", result.removedMissingCount},
         {"remaining_count", result.remaining.size()}});
}

void CommandConsole::handlePermission(const QStringList& args) {
    if (permission_ == nullptr) {
        respondError("permission", "No microphone permission gate is available.");
        return;
    }
    if (args.isEmpty()) {
        const PermissionState state = permission_->state();
        respond("permission", true, {{"granted", state.granted}, {"can_ask_again", state.canAskAgain}});
        return;
    }
    if (args.size() != 1 || args.first() != "settings") {
        respondError("permission", "Usage: permission [settings]");
        return;
    }
    if (!permission_->openSystemSettings()) {
        respondError("permission", "Microphone settings could not be opened on this platform.");
        return;
    }
    respond("permission", true, {{"opened", true}});
}

void CommandConsole::pushBookings() {
    controller_->setBookings(QVector<BookingSession>(bookings_.cbegin(), bookings_.cend()));
}

void CommandConsole::pushShares() {
    controller_->setLocationShares(QVector<LocationShare>(shares_.cbegin(), shares_.cend()));
}

void CommandConsole::respond(const QString& command, bool ok, const QJsonObject& body) {
    QJsonObject out = body;
    out.insert("command", command);
    out.insert("ok", ok);
    writeLine(out);
}

void CommandConsole::respondError(const QString& command, const QString& error) {
    respond(command, false, {{"error", error}});
}

void CommandConsole::writeLine(const QJsonObject& object) {
    if (output_ == nullptr) {
        return;
    }
    output_->write(QJsonDocument(object).toJson(QJsonDocument::Compact));
    output_->write("\n");
}

}  // namespace sacore
