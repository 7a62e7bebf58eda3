#pragma once

#include <QJsonObject>
#include <QMap>
#include <QObject>
#include <QString>
#include <QStringList>

#include "sacore/reconciliation.hpp"

class QIODevice;
class QSocketNotifier;

namespace sacore {

class Clock;
class EventChannel;
class PermissionGate;
class SafetyAudioController;

// Line-oriented control surface for the daemon. Every command produces one
// JSON object per line on |output|; notices and recorder events are written
// the same way as they happen.
class CommandConsole final : public QObject {
    Q_OBJECT

public:
    CommandConsole(
        SafetyAudioController* controller,
        EventChannel* events,
        PermissionGate* permission,
        const Clock* clock,
        QIODevice* output,
        QObject* parent = nullptr);
    ~CommandConsole() override;

    // Reads commands from stdin as they arrive.
    void attachStdin();

    void handleLine(const QString& line);

    static QStringList tokenize(const QString& line);
    static QString helpText();

signals:
    void quitRequested();

private:
    void respond(const QString& command, bool ok, const QJsonObject& body = {});
    void respondError(const QString& command, const QString& error);
    void writeLine(const QJsonObject& object);
    void readStdin();

    void handleStart(const QStringList& args);
    void handleStop(const QStringList& args);
    void handleBooking(const QStringList& args);
    void handleShare(const QStringList& args);
    void handleOverride(const QStringList& args);
    void handleAuto(const QStringList& args);
    void handleRecordings();
    void handleDelete(const QStringList& args);
    void handleCleanup();
    void handlePermission(const QStringList& args);

    void pushBookings();
    void pushShares();

    SafetyAudioController* controller_;
    EventChannel* events_;
    PermissionGate* permission_;
    const Clock* clock_;
    QIODevice* output_;
    QSocketNotifier* stdinNotifier_ = nullptr;
    QByteArray stdinBuffer_;
    int eventSubscription_ = 0;

    QMap<QString, BookingSession> bookings_;
    QMap<QString, LocationShare> shares_;
};

}  // namespace sacore
