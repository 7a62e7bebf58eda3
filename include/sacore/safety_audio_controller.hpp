#pragma once

#include <QFuture>
#include <QJsonObject>
#include <QObject>
#include <QPromise>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QVector>

#include <memory>
#include <optional>

#include "sacore/engine_config.hpp"
#include "sacore/reconciliation.hpp"
#include "sacore/recorder_events.hpp"
#include "sacore/retention_cleaner.hpp"
#include "sacore/types.hpp"

namespace sacore {

class Clock;
class OrphanRecovery;
class OverrideStore;
class Recorder;
class RecordingStore;
class StorageMonitor;
class TelemetrySink;

struct OperationResult {
    bool success = false;
    QString error;
};

// Turns the current trigger contexts and user overrides into a desired
// recording state and drives the recorder toward it.
class SafetyAudioController final : public QObject {
    Q_OBJECT

public:
    struct Dependencies {
        Recorder* recorder = nullptr;
        RecordingStore* store = nullptr;
        StorageMonitor* storage = nullptr;
        RetentionCleaner* cleaner = nullptr;
        OrphanRecovery* recovery = nullptr;
        OverrideStore* overrideStore = nullptr;
        const Clock* clock = nullptr;
        TelemetrySink* telemetry = nullptr;
    };

    SafetyAudioController(const Dependencies& deps, const EngineConfig& config, QObject* parent = nullptr);
    ~SafetyAudioController() override;

    void initialize();

    void setBookings(const QVector<BookingSession>& bookings);
    void setLocationShares(const QVector<LocationShare>& shares);
    void setAutoRecordDefault(bool enabled);
    void setOverride(const QString& contextKey, std::optional<OverrideState> state);
    void refreshActiveContexts();

    QFuture<Evaluation> reconcile();
    QFuture<OperationResult> startRecording(const QString& contextKey = kManualContextKey);
    QFuture<OperationResult> stopRecording(const QString& reason = "manual-stop");
    QFuture<void> shutdown(const QString& reason = "app-exit");

    void handleForeground();
    CleanupResult runRetentionCleanup();

    QVector<Recording> recordings();
    bool deleteRecording(const QString& recordingId);
    bool clearAllRecordings();

    [[nodiscard]] QJsonObject statusSnapshot() const;
    [[nodiscard]] QStringList activeContextKeys() const { return activeContextKeys_; }
    [[nodiscard]] OverrideMap overrides() const { return overrides_; }
    [[nodiscard]] bool autoRecordDefault() const { return autoRecordDefault_; }
    [[nodiscard]] bool isReconciling() const { return busy_; }
    [[nodiscard]] bool isRecording() const;

signals:
    void noticeRaised(const QString& title, const QString& message);
    void recordingsChanged();
    void recordingStateChanged(bool recording);

private:
    void runReconcilePass();
    void continueReconcilePass(const Evaluation& evaluation);
    void startForEvaluation(const Evaluation& evaluation);
    void finishReconcilePass(const Evaluation& evaluation);

    void onRecorderEvent(const RecorderEvent& event);
    void onStorageStatusChanged(const StorageStatus& status);

    void updateActiveContextKeys(const QStringList& keys);
    void pruneAndPersistOverrides();
    void persistOverrides();
    void scheduleShareExpiry();
    void raiseNotice(const QString& title, const QString& message);

    Dependencies deps_;
    EngineConfig config_;

    QVector<BookingSession> bookings_;
    QVector<LocationShare> shares_;
    QStringList activeContextKeys_;
    OverrideMap overrides_;
    bool autoRecordDefault_ = false;
    bool initialized_ = false;

    bool busy_ = false;
    std::shared_ptr<QPromise<Evaluation>> currentPass_;
    std::shared_ptr<QPromise<Evaluation>> followUpPass_;
    std::optional<EngineError> lastStartError_;
    bool criticalStopInFlight_ = false;

    int recorderSubscription_ = 0;
    QTimer shareExpiryTimer_;
};

}  // namespace sacore
