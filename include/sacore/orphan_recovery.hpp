#pragma once

#include <QVector>

#include <optional>

#include "sacore/types.hpp"

namespace sacore {

class EventChannel;
class RecordingStore;
class TelemetrySink;

struct RecoveryReport {
    int scannedFiles = 0;
    int skippedFiles = 0;
    QVector<Recording> recovered;
    std::optional<EngineError> error;
};

// Indexes capture files that exist on disk but not in the recording index,
// typically left behind when the process died mid-segment. Safe to run
// repeatedly: a file already indexed by path is never adopted twice.
class OrphanRecovery {
public:
    OrphanRecovery(RecordingStore* store, EventChannel* events, TelemetrySink* telemetry = nullptr);

    RecoveryReport run();

    static Recording recordingForOrphan(const QString& filePath, qint64 durationMs, qint64 retentionWindowMs);

private:
    RecordingStore* store_;
    EventChannel* events_;
    TelemetrySink* telemetry_;
};

}  // namespace sacore
