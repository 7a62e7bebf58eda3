#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QSettings>
#include <QTimer>

#include <atomic>
#include <csignal>
#include <cstdio>

#include "sacore/clock.hpp"
#include "sacore/command_console.hpp"
#include "sacore/engine_config.hpp"
#include "sacore/keep_alive.hpp"
#include "sacore/logging.hpp"
#include "sacore/qt_audio_capture_device.hpp"
#include "sacore/qt_microphone_permission.hpp"
#include "sacore/recorder.hpp"
#include "sacore/safety_audio_controller.hpp"
#include "sacore/safety_audio_engine.hpp"
#include "sacore/storage_monitor.hpp"
#include "sacore/systemd_inhibit_keep_alive.hpp"
#include "sacore/telemetry.hpp"

namespace {

std::atomic<bool> g_quitSignalled {false};

void onQuitSignal(int) {
    g_quitSignalled.store(true);
}

void installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = onQuitSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("safety-audio-daemon");
    app.setOrganizationName("SafetyAudio");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Local safety audio recording engine");
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption("config", "Engine configuration JSON file.", "path");
    const QCommandLineOption rootOption("root", "Recording root directory.", "dir");
    const QCommandLineOption autoRecordOption("auto-record", "Record automatically while a context is active.");
    const QCommandLineOption keepAliveOption("keep-alive", "Inhibit system sleep while recording.");
    const QCommandLineOption noConsoleOption("no-console", "Do not read commands from stdin.");
    parser.addOptions({configOption, rootOption, autoRecordOption, keepAliveOption, noConsoleOption});
    parser.process(app);

    sacore::EngineConfig config = sacore::EngineConfig::defaults();
    if (parser.isSet(configOption)) {
        const sacore::ConfigLoadResult loaded = sacore::loadEngineConfig(parser.value(configOption));
        if (!loaded.success) {
            qCCritical(lcConsole) << "Invalid config" << loaded.path << ":" << loaded.error;
            return 2;
        }
        config = loaded.config;
    }
    sacore::applyEnvironmentOverrides(config);
    if (parser.isSet(rootOption)) {
        config.rootDirectory = parser.value(rootOption);
    }
    if (parser.isSet(autoRecordOption)) {
        config.autoRecordDefault = true;
    }
    if (parser.isSet(keepAliveOption)) {
        config.keepAliveEnabled = true;
    }
    const QString invalid = config.validate();
    if (!invalid.isEmpty()) {
        qCCritical(lcConsole) << "Invalid configuration:" << invalid;
        return 2;
    }

    sacore::SystemClock clock;
    sacore::Telemetry telemetry;
    QSettings settings;
    sacore::QtAudioCaptureDevice device;
    sacore::QtMicrophonePermission permission;
    sacore::SystemdInhibitKeepAlive keepAlive;
    QDir().mkpath(config.rootDirectory);
    sacore::VolumeFreeSpaceProbe freeSpace(config.rootDirectory);

    sacore::EnginePlatform platform;
    platform.device = &device;
    platform.permission = &permission;
    platform.keepAlive = &keepAlive;
    platform.freeSpace = &freeSpace;
    platform.settings = &settings;
    platform.clock = &clock;
    platform.telemetry = &telemetry;
    sacore::SafetyAudioEngine engine(config, platform);
    sacore::SafetyAudioController& controller = engine.controller();

    QFile standardOutput;
    if (!standardOutput.open(stdout, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        qCCritical(lcConsole) << "Unable to open stdout";
        return 1;
    }
    sacore::CommandConsole console(
        &controller, &engine.recorder().events(), &permission, &clock, &standardOutput);

    bool shuttingDown = false;
    auto requestQuit = [&]() {
        if (shuttingDown) {
            return;
        }
        shuttingDown = true;
        controller.shutdown("app-exit").then(&app, []() { QCoreApplication::quit(); });
    };
    QObject::connect(&console, &sacore::CommandConsole::quitRequested, &app, requestQuit);

    installSignalHandlers();
    QTimer signalPoll;
    QObject::connect(&signalPoll, &QTimer::timeout, &app, [&]() {
        if (g_quitSignalled.load()) {
            qCInfo(lcConsole) << "Termination signal received";
            requestQuit();
        }
    });
    signalPoll.start(200);

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&telemetry]() {
        const QString path = QDir(QDir::currentPath()).filePath("logs/telemetry_last_exit.json");
        QString error;
        if (!telemetry.exportToFile(path, &error)) {
            qCWarning(lcConsole) << "Telemetry export failed:" << error;
        }
    });

    controller.initialize();
    if (!parser.isSet(noConsoleOption)) {
        console.attachStdin();
    }
    qCInfo(lcConsole) << "Safety audio daemon ready, recordings in" << config.rootDirectory;

    return QCoreApplication::exec();
}
