#include "sacore/safety_audio_controller.hpp"

#include <QJsonArray>

#include <climits>
#include <variant>

#include "sacore/clock.hpp"
#include "sacore/logging.hpp"
#include "sacore/orphan_recovery.hpp"
#include "sacore/override_store.hpp"
#include "sacore/recorder.hpp"
#include "sacore/recording_store.hpp"
#include "sacore/storage_monitor.hpp"
#include "sacore/telemetry.hpp"

namespace sacore {

namespace {

// Runs |fn| now when |future| is already finished, otherwise as a
// continuation on |context|'s thread.
template <typename T, typename Fn>
void whenFinished(QObject* context, QFuture<T> future, Fn fn) {
    if (future.isFinished()) {
        fn(future);
        return;
    }
    future.then(context, [fn](QFuture<T> done) { fn(done); });
}

QFuture<void> finishedVoidFuture() {
    QPromise<void> promise;
    QFuture<void> future = promise.future();
    promise.start();
    promise.finish();
    return future;
}

}  // namespace

SafetyAudioController::SafetyAudioController(
    const Dependencies& deps,
    const EngineConfig& config,
    QObject* parent)
    : QObject(parent),
      deps_(deps),
      config_(config),
      autoRecordDefault_(config.autoRecordDefault) {
    recorderSubscription_ = deps_.recorder->events().subscribe(
        [this](const RecorderEvent& event) { onRecorderEvent(event); });
    connect(deps_.storage, &StorageMonitor::statusChanged, this, &SafetyAudioController::onStorageStatusChanged);

    connect(deps_.cleaner, &RetentionCleaner::passCompleted, this, [this](int deleted, int missing) {
        if (deleted > 0 || missing > 0) {
            emit recordingsChanged();
        }
    });

    shareExpiryTimer_.setSingleShot(true);
    connect(&shareExpiryTimer_, &QTimer::timeout, this, [this]() {
        refreshActiveContexts();
        reconcile();
    });
}

SafetyAudioController::~SafetyAudioController() {
    deps_.recorder->events().unsubscribe(recorderSubscription_);
}

bool SafetyAudioController::isRecording() const {
    return deps_.recorder->isRunning();
}

void SafetyAudioController::initialize() {
    if (initialized_) {
        return;
    }
    overrides_ = deps_.overrideStore->load();

    if (deps_.recorder->state() == RecorderState::Idle && !deps_.recorder->activeSession()) {
        const RecoveryReport report = deps_.recovery->run();
        if (report.error) {
            qCWarning(lcController) << "Crash recovery incomplete:" << report.error->message;
        }
        if (!report.recovered.isEmpty()) {
            emit recordingsChanged();
        }
    }

    runRetentionCleanup();
    deps_.storage->refresh();
    deps_.storage->startPolling(config_.storagePollIntervalMs);
    deps_.cleaner->startSchedule(config_.retentionIntervalMs);

    refreshActiveContexts();
    pruneAndPersistOverrides();
    initialized_ = true;
    qCInfo(lcController) << "Safety audio engine initialized with root" << deps_.store->rootDirectory();
    reconcile();
}

void SafetyAudioController::setBookings(const QVector<BookingSession>& bookings) {
    bookings_ = bookings;
    refreshActiveContexts();
    reconcile();
}

void SafetyAudioController::setLocationShares(const QVector<LocationShare>& shares) {
    shares_ = shares;
    refreshActiveContexts();
    scheduleShareExpiry();
    reconcile();
}

void SafetyAudioController::setAutoRecordDefault(bool enabled) {
    if (autoRecordDefault_ == enabled) {
        return;
    }
    autoRecordDefault_ = enabled;
    reconcile();
}

void SafetyAudioController::setOverride(const QString& contextKey, std::optional<OverrideState> state) {
    const QString key = contextKey.trimmed();
    if (key.isEmpty()) {
        return;
    }
    if (state) {
        overrides_.insert(key, *state);
    } else {
        overrides_.remove(key);
    }
    persistOverrides();
    reconcile();
}

void SafetyAudioController::refreshActiveContexts() {
    updateActiveContextKeys(deriveActiveContextKeys(bookings_, shares_, deps_.clock->nowMs()));
}

void SafetyAudioController::updateActiveContextKeys(const QStringList& keys) {
    if (keys == activeContextKeys_) {
        return;
    }
    activeContextKeys_ = keys;
    qCDebug(lcController) << "Active contexts" << activeContextKeys_;
    if (initialized_) {
        pruneAndPersistOverrides();
    }
}

void SafetyAudioController::pruneAndPersistOverrides() {
    const OverrideMap pruned = pruneOverrides(overrides_, activeContextKeys_);
    if (pruned == overrides_) {
        return;
    }
    overrides_ = pruned;
    persistOverrides();
}

void SafetyAudioController::persistOverrides() {
    if (!deps_.overrideStore->save(overrides_)) {
        qCWarning(lcController) << "Unable to persist safety audio overrides";
    }
}

void SafetyAudioController::scheduleShareExpiry() {
    shareExpiryTimer_.stop();
    const qint64 nowMs = deps_.clock->nowMs();
    qint64 earliest = 0;
    for (const LocationShare& share : shares_) {
        if (share.status != "active" || share.expiresAtMs <= nowMs) {
            continue;
        }
        if (earliest == 0 || share.expiresAtMs < earliest) {
            earliest = share.expiresAtMs;
        }
    }
    if (earliest == 0) {
        return;
    }
    const qint64 delayMs = qBound<qint64>(0, earliest - nowMs, INT_MAX - 1) + 1;
    shareExpiryTimer_.start(static_cast<int>(delayMs));
}

QFuture<Evaluation> SafetyAudioController::reconcile() {
    if (busy_) {
        if (!followUpPass_) {
            followUpPass_ = std::make_shared<QPromise<Evaluation>>();
            followUpPass_->start();
        }
        return followUpPass_->future();
    }

    busy_ = true;
    currentPass_ = std::make_shared<QPromise<Evaluation>>();
    currentPass_->start();
    QFuture<Evaluation> future = currentPass_->future();
    runReconcilePass();
    return future;
}

void SafetyAudioController::runReconcilePass() {
    const Evaluation evaluation = evaluateDesiredState(activeContextKeys_, overrides_, autoRecordDefault_);

    QFuture<void> contextUpdate = finishedVoidFuture();
    if (!evaluation.contextKeys.isEmpty() && deps_.recorder->isRunning()) {
        contextUpdate = deps_.recorder->updateSessionContext(evaluation.contextKeys);
    }
    whenFinished(this, contextUpdate, [this, evaluation](const QFuture<void>&) {
        continueReconcilePass(evaluation);
    });
}

void SafetyAudioController::continueReconcilePass(const Evaluation& evaluation) {
    if (evaluation.shouldRecord == deps_.recorder->isRunning()) {
        finishReconcilePass(evaluation);
        return;
    }

    if (evaluation.shouldRecord) {
        startForEvaluation(evaluation);
        return;
    }

    whenFinished(this, deps_.recorder->stop("context-not-active"), [this, evaluation](const QFuture<void>&) {
        reportTelemetry(deps_.telemetry, "safety_audio_stop", {{"reason", "context-not-active"}});
        finishReconcilePass(evaluation);
    });
}

void SafetyAudioController::startForEvaluation(const Evaluation& evaluation) {
    const StorageStatus storage = deps_.storage->refresh();
    const double freeBytes = static_cast<double>(storage.freeBytes.value_or(-1));
    if (storage.critical) {
        lastStartError_ = EngineError {ErrorCode::StorageCritical, "Device storage is critically low."};
        reportTelemetry(deps_.telemetry, "safety_audio_storage_critical_block", {{"freeBytes", freeBytes}});
        raiseNotice(
            "Storage Too Low",
            "Safety audio recording is off because your device storage is critically low. "
            "Free up space and try again.");
        finishReconcilePass(evaluation);
        return;
    }
    if (storage.warning) {
        reportTelemetry(deps_.telemetry, "safety_audio_storage_low_warning", {{"freeBytes", freeBytes}});
    }

    const QString startKey = preferredStartKey(evaluation, overrides_);
    const ContextDescriptor descriptor = resolveDescriptor(startKey);

    StartRequest request;
    request.descriptor = descriptor;
    request.contextKeys = evaluation.contextKeys;
    request.reason = descriptor.contextType == ContextType::Manual ? SessionReason::Manual : SessionReason::Auto;

    whenFinished(this, deps_.recorder->start(request), [this, evaluation, descriptor](const QFuture<StartResult>& done) {
        const StartResult result = done.result();
        if (!result.started) {
            const EngineError error = result.error.value_or(
                EngineError {ErrorCode::DeviceUnavailable, "Please try again."});
            lastStartError_ = error;
            if (error.code == ErrorCode::PermissionDenied) {
                reportTelemetry(deps_.telemetry, "safety_audio_permission_denied", {{"message", error.message}});
            }
            reportTelemetry(
                deps_.telemetry,
                "safety_audio_start_failed",
                {{"code", toString(error.code)}, {"contextType", toString(descriptor.contextType)}});
            raiseNotice("Unable to start recording", error.message);
        } else if (!result.alreadyRunning) {
            lastStartError_.reset();
            reportTelemetry(
                deps_.telemetry,
                descriptor.contextType == ContextType::Manual ? "safety_audio_start" : "safety_audio_autostart",
                {{"contextType", toString(descriptor.contextType)}});
        }
        finishReconcilePass(evaluation);
    });
}

void SafetyAudioController::finishReconcilePass(const Evaluation& evaluation) {
    const auto finished = currentPass_;
    finished->addResult(evaluation);
    finished->finish();

    if (followUpPass_) {
        currentPass_ = followUpPass_;
        followUpPass_.reset();
        runReconcilePass();
        return;
    }
    currentPass_.reset();
    busy_ = false;
}

QFuture<OperationResult> SafetyAudioController::startRecording(const QString& contextKey) {
    const QString key = contextKey.trimmed().isEmpty() ? kManualContextKey : contextKey.trimmed();
    overrides_.insert(key, OverrideState::ForceOn);
    persistOverrides();
    lastStartError_.reset();

    auto promise = std::make_shared<QPromise<OperationResult>>();
    QFuture<OperationResult> future = promise->future();
    promise->start();

    whenFinished(this, reconcile(), [this, key, promise](const QFuture<Evaluation>&) {
        OperationResult result;
        if (deps_.recorder->isRunning()) {
            result.success = true;
        } else {
            overrides_.remove(key);
            persistOverrides();
            result.error = lastStartError_ ? lastStartError_->message
                                           : QString("Unable to start local safety audio recording right now.");
        }
        promise->addResult(result);
        promise->finish();
    });
    return future;
}

QFuture<OperationResult> SafetyAudioController::stopRecording(const QString& reason) {
    QStringList keys = activeContextKeys_;
    keys.append(overrides_.keys());
    keys.append(kManualContextKey);
    for (const QString& key : uniqueContextKeys(keys)) {
        overrides_.insert(key, OverrideState::ForceOff);
    }
    persistOverrides();

    auto promise = std::make_shared<QPromise<OperationResult>>();
    QFuture<OperationResult> future = promise->future();
    promise->start();

    whenFinished(this, deps_.recorder->stop(reason), [this, reason, promise](const QFuture<void>&) {
        runRetentionCleanup();
        reportTelemetry(deps_.telemetry, "safety_audio_stop", {{"reason", reason}});
        promise->addResult(OperationResult {true, {}});
        promise->finish();
    });
    return future;
}

QFuture<void> SafetyAudioController::shutdown(const QString& reason) {
    shareExpiryTimer_.stop();
    deps_.storage->stopPolling();
    deps_.cleaner->stopSchedule();
    if (!deps_.recorder->isRunning() && !deps_.recorder->hasOpenSegment()) {
        return finishedVoidFuture();
    }
    qCInfo(lcController) << "Stopping recorder for shutdown:" << reason;
    reportTelemetry(deps_.telemetry, "safety_audio_stop", {{"reason", reason}});
    return deps_.recorder->stop(reason);
}

void SafetyAudioController::handleForeground() {
    runRetentionCleanup();
    deps_.storage->refresh();
}

QVector<Recording> SafetyAudioController::recordings() {
    return deps_.store->list();
}

bool SafetyAudioController::deleteRecording(const QString& recordingId) {
    if (!deps_.store->find(recordingId)) {
        return false;
    }
    if (!deps_.store->removeRecording(recordingId, true)) {
        return false;
    }
    emit recordingsChanged();
    return true;
}

bool SafetyAudioController::clearAllRecordings() {
    if (!deps_.store->clearAll()) {
        return false;
    }
    emit recordingsChanged();
    return true;
}

QJsonObject SafetyAudioController::statusSnapshot() const {
    QJsonArray keys;
    for (const QString& key : activeContextKeys_) {
        keys.append(key);
    }
    QJsonObject overrides;
    for (auto it = overrides_.cbegin(); it != overrides_.cend(); ++it) {
        overrides.insert(it.key(), toString(it.value()));
    }

    const auto session = deps_.recorder->activeSession();
    QJsonObject out;
    out.insert("recording", deps_.recorder->isRunning());
    out.insert("recorder_state", toString(deps_.recorder->state()));
    out.insert(
        "session",
        session ? QJsonValue(toJson(*session, deps_.clock->nowMs())) : QJsonValue(QJsonValue::Null));
    out.insert("active_context_keys", keys);
    out.insert("overrides", overrides);
    out.insert("auto_record_default", autoRecordDefault_);
    out.insert("reconciling", busy_);
    out.insert("storage", toJson(deps_.storage->status()));
    out.insert("root_directory", deps_.store->rootDirectory());
    if (lastStartError_) {
        out.insert("last_error", toJson(*lastStartError_));
    }
    return out;
}

void SafetyAudioController::onRecorderEvent(const RecorderEvent& event) {
    if (std::holds_alternative<StartedEvent>(event) || std::holds_alternative<StoppedEvent>(event)) {
        emit recordingStateChanged(std::holds_alternative<StartedEvent>(event));
        QTimer::singleShot(0, this, [this]() { reconcile(); });
        return;
    }
    if (std::holds_alternative<SegmentSavedEvent>(event) || std::holds_alternative<RecoveredEvent>(event)) {
        emit recordingsChanged();
        return;
    }
    if (const auto* failure = std::get_if<ErrorEvent>(&event)) {
        qCWarning(lcController) << "Recorder error:" << toString(failure->error.code) << failure->error.message;
        raiseNotice("Recording Error", failure->error.message);
    }
}

void SafetyAudioController::onStorageStatusChanged(const StorageStatus& status) {
    if (!status.critical || !deps_.recorder->isRunning() || criticalStopInFlight_) {
        return;
    }
    criticalStopInFlight_ = true;
    raiseNotice(
        "Recording Stopped",
        "Safety audio recording was stopped because your device is critically low on storage.");
    reportTelemetry(
        deps_.telemetry,
        "safety_audio_storage_critical_stop",
        {{"freeBytes", static_cast<double>(status.freeBytes.value_or(-1))}});
    whenFinished(this, deps_.recorder->stop("storage-critical"), [this](const QFuture<void>&) {
        criticalStopInFlight_ = false;
    });
}

CleanupResult SafetyAudioController::runRetentionCleanup() {
    return deps_.cleaner->runPass();
}

void SafetyAudioController::raiseNotice(const QString& title, const QString& message) {
    qCInfo(lcController) << "Notice:" << title << "-" << message;
    emit noticeRaised(title, message);
}

}  // namespace sacore
