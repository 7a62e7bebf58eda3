#pragma once

#include <QSettings>

#include <memory>

#include "sacore/engine_config.hpp"
#include "sacore/keep_alive.hpp"

namespace sacore {

class CaptureDevice;
class Clock;
class FreeSpaceProbe;
class OrphanRecovery;
class OverrideStore;
class PermissionGate;
class Recorder;
class RecordingStore;
class RetentionCleaner;
class SafetyAudioController;
class StorageMonitor;
class TelemetrySink;

// Host-provided collaborators. None are owned by the engine.
struct EnginePlatform {
    CaptureDevice* device = nullptr;
    PermissionGate* permission = nullptr;
    KeepAlive* keepAlive = nullptr;
    const FreeSpaceProbe* freeSpace = nullptr;
    QSettings* settings = nullptr;
    const Clock* clock = nullptr;
    TelemetrySink* telemetry = nullptr;
};

// Wires one engine instance. Members are destroyed in reverse order, so the
// controller goes before the recorder it subscribes to.
class SafetyAudioEngine {
public:
    SafetyAudioEngine(const EngineConfig& config, const EnginePlatform& platform);
    ~SafetyAudioEngine();

    SafetyAudioEngine(const SafetyAudioEngine&) = delete;
    SafetyAudioEngine& operator=(const SafetyAudioEngine&) = delete;

    [[nodiscard]] const EngineConfig& config() const { return config_; }
    RecordingStore& store() { return *store_; }
    StorageMonitor& storage() { return *storage_; }
    Recorder& recorder() { return *recorder_; }
    RetentionCleaner& cleaner() { return *cleaner_; }
    OrphanRecovery& recovery() { return *recovery_; }
    OverrideStore& overrideStore() { return *overrideStore_; }
    SafetyAudioController& controller() { return *controller_; }

private:
    EngineConfig config_;
    NoopKeepAlive disabledKeepAlive_;
    std::unique_ptr<RecordingStore> store_;
    std::unique_ptr<StorageMonitor> storage_;
    std::unique_ptr<Recorder> recorder_;
    std::unique_ptr<RetentionCleaner> cleaner_;
    std::unique_ptr<OrphanRecovery> recovery_;
    std::unique_ptr<OverrideStore> overrideStore_;
    std::unique_ptr<SafetyAudioController> controller_;
};

}  // namespace sacore
