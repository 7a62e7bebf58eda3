#include "sacore/safety_audio_engine.hpp"

#include "sacore/orphan_recovery.hpp"
#include "sacore/override_store.hpp"
#include "sacore/recorder.hpp"
#include "sacore/recording_store.hpp"
#include "sacore/retention_cleaner.hpp"
#include "sacore/safety_audio_controller.hpp"
#include "sacore/storage_monitor.hpp"

namespace sacore {

SafetyAudioEngine::SafetyAudioEngine(const EngineConfig& config, const EnginePlatform& platform)
    : config_(config) {
    store_ = std::make_unique<RecordingStore>(config_.rootDirectory, config_.retentionWindowMs);
    storage_ = std::make_unique<StorageMonitor>(
        platform.freeSpace,
        config_.warningThresholdBytes,
        config_.criticalThresholdBytes,
        platform.telemetry);

    Recorder::Dependencies recorderDeps;
    recorderDeps.device = platform.device;
    recorderDeps.permission = platform.permission;
    recorderDeps.storage = storage_.get();
    recorderDeps.store = store_.get();
    recorderDeps.keepAlive = config_.keepAliveEnabled && platform.keepAlive != nullptr
        ? platform.keepAlive
        : &disabledKeepAlive_;
    recorderDeps.clock = platform.clock;
    recorderDeps.telemetry = platform.telemetry;
    recorder_ = std::make_unique<Recorder>(recorderDeps, config_.segmentDurationMs);

    cleaner_ = std::make_unique<RetentionCleaner>(store_.get(), platform.clock, platform.telemetry);
    recovery_ = std::make_unique<OrphanRecovery>(store_.get(), &recorder_->events(), platform.telemetry);
    overrideStore_ = std::make_unique<OverrideStore>(platform.settings);

    SafetyAudioController::Dependencies controllerDeps;
    controllerDeps.recorder = recorder_.get();
    controllerDeps.store = store_.get();
    controllerDeps.storage = storage_.get();
    controllerDeps.cleaner = cleaner_.get();
    controllerDeps.recovery = recovery_.get();
    controllerDeps.overrideStore = overrideStore_.get();
    controllerDeps.clock = platform.clock;
    controllerDeps.telemetry = platform.telemetry;
    controller_ = std::make_unique<SafetyAudioController>(controllerDeps, config_);
}

SafetyAudioEngine::~SafetyAudioEngine() = default;

}  // namespace sacore
