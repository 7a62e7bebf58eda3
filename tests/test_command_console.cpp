#include <QBuffer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include <memory>

#include "fakes.hpp"
#include "sacore/command_console.hpp"
#include "sacore/recorder.hpp"
#include "sacore/safety_audio_controller.hpp"
#include "sacore/safety_audio_engine.hpp"

using namespace sacore;
using namespace sacore::testing;

namespace {

class CommandConsoleTest : public ::testing::Test {
protected:
    CommandConsoleTest()
        : settings_(dir_.filePath("settings.ini"), QSettings::IniFormat),
          device_(&clock_) {
        EngineConfig config = EngineConfig::defaults();
        config.rootDirectory = dir_.filePath("root");

        EnginePlatform platform;
        platform.device = &device_;
        platform.permission = &permission_;
        platform.freeSpace = &freeSpace_;
        platform.settings = &settings_;
        platform.clock = &clock_;
        platform.telemetry = &telemetry_;
        engine_ = std::make_unique<SafetyAudioEngine>(config, platform);
        engine_->controller().initialize();

        output_.open(QIODevice::WriteOnly);
        console_ = std::make_unique<CommandConsole>(
            &engine_->controller(), &engine_->recorder().events(), &permission_, &clock_, &output_);
    }

    QVector<QJsonObject> lines() const {
        QVector<QJsonObject> out;
        for (const QByteArray& line : output_.data().split('\n')) {
            if (!line.trimmed().isEmpty()) {
                out.append(QJsonDocument::fromJson(line).object());
            }
        }
        return out;
    }

    // Last response line for |command|, or an empty object.
    QJsonObject response(const QString& command) const {
        const QVector<QJsonObject> all = lines();
        for (auto it = all.crbegin(); it != all.crend(); ++it) {
            if (it->value("command").toString() == command) {
                return *it;
            }
        }
        return {};
    }

    bool hasResponse(const QString& command) const { return !response(command).isEmpty(); }

    QTemporaryDir dir_;
    QSettings settings_;
    ManualClock clock_;
    FakeCaptureDevice device_;
    FakePermission permission_;
    FakeFreeSpace freeSpace_;
    Telemetry telemetry_;
    std::unique_ptr<SafetyAudioEngine> engine_;
    QBuffer output_;
    std::unique_ptr<CommandConsole> console_;
};

}  // namespace

TEST(CommandConsoleTokenize, CollapsesWhitespace) {
    EXPECT_EQ(CommandConsole::tokenize("  booking   add  42 "), (QStringList {"booking", "add", "42"}));
    EXPECT_TRUE(CommandConsole::tokenize("   ").isEmpty());
}

TEST_F(CommandConsoleTest, StatusReportsSnapshot) {
    console_->handleLine("status");
    const QJsonObject status = response("status");
    EXPECT_TRUE(status.value("ok").toBool());
    EXPECT_FALSE(status.value("recording").toBool());
    EXPECT_EQ(status.value("root_directory").toString(), dir_.filePath("root"));
}

TEST_F(CommandConsoleTest, UnknownCommandIsAnError) {
    console_->handleLine("dance");
    const QJsonObject reply = response("dance");
    EXPECT_FALSE(reply.value("ok").toBool());
    EXPECT_TRUE(reply.value("error").toString().contains("Unknown command"));
}

TEST_F(CommandConsoleTest, BlankLinesAreIgnored) {
    console_->handleLine("   ");
    EXPECT_TRUE(lines().isEmpty());
}

TEST_F(CommandConsoleTest, BookingCommandsDriveActiveContexts) {
    console_->handleLine("booking add 42");
    QJsonObject reply = response("booking");
    EXPECT_TRUE(reply.value("ok").toBool());
    EXPECT_EQ(reply.value("active_context_keys").toArray().first().toString(), "booking:42");

    console_->handleLine("booking end 42");
    EXPECT_TRUE(response("booking").value("active_context_keys").toArray().isEmpty());

    console_->handleLine("booking pause 42");
    EXPECT_FALSE(response("booking").value("ok").toBool());
}

TEST_F(CommandConsoleTest, ShareRequiresPositiveMinutes) {
    console_->handleLine("share add conv nope");
    EXPECT_FALSE(response("share").value("ok").toBool());

    console_->handleLine("share add conv 15");
    const QJsonObject reply = response("share");
    EXPECT_TRUE(reply.value("ok").toBool());
    EXPECT_EQ(reply.value("active_context_keys").toArray().first().toString(), "live_location:conv");
}

TEST_F(CommandConsoleTest, ShareRejectsNonFiniteOrOversizedMinutes) {
    for (const QString& minutes : {QString("inf"), QString("nan"), QString("1e300"), QString("-5"), QString("10081")}) {
        console_->handleLine("share add conv " + minutes);
        EXPECT_FALSE(response("share").value("ok").toBool()) << minutes.toStdString();
    }
    EXPECT_TRUE(engine_->controller().activeContextKeys().isEmpty());

    console_->handleLine("share add conv 10080");
    EXPECT_TRUE(response("share").value("ok").toBool());
}

TEST_F(CommandConsoleTest, AutoAndOverrideStartRecording) {
    console_->handleLine("booking add 42");
    console_->handleLine("auto on");
    EXPECT_TRUE(response("auto").value("auto_record_default").toBool());
    EXPECT_TRUE(waitUntil([this]() { return engine_->controller().isRecording(); }));

    console_->handleLine("override booking:42 off");
    const QJsonObject reply = response("override");
    EXPECT_TRUE(reply.value("ok").toBool());
    EXPECT_EQ(reply.value("overrides").toObject().value("booking:42").toString(), "force_off");
    EXPECT_FALSE(engine_->controller().isRecording());

    console_->handleLine("override booking:42 maybe");
    EXPECT_FALSE(response("override").value("ok").toBool());
}

TEST_F(CommandConsoleTest, StartAndStopRespondAsynchronously) {
    console_->handleLine("start");
    ASSERT_TRUE(waitUntil([this]() { return hasResponse("start"); }));
    EXPECT_TRUE(response("start").value("ok").toBool());
    EXPECT_TRUE(response("start").value("recording").toBool());

    console_->handleLine("stop");
    ASSERT_TRUE(waitUntil([this]() { return hasResponse("stop"); }));
    EXPECT_FALSE(response("stop").value("recording").toBool());

    bool sawStartedEvent = false;
    for (const QJsonObject& line : lines()) {
        sawStartedEvent = sawStartedEvent || line.value("event").toString() == "started";
    }
    EXPECT_TRUE(sawStartedEvent);

    console_->handleLine("recordings");
    EXPECT_EQ(response("recordings").value("recordings").toArray().size(), 1);
}

TEST_F(CommandConsoleTest, FailedStartReportsError) {
    freeSpace_.value = 10 * kMiB;
    console_->handleLine("start");
    ASSERT_TRUE(waitUntil([this]() { return hasResponse("start"); }));
    const QJsonObject reply = response("start");
    EXPECT_FALSE(reply.value("ok").toBool());
    EXPECT_FALSE(reply.value("error").toString().isEmpty());

    bool sawNotice = false;
    for (const QJsonObject& line : lines()) {
        sawNotice = sawNotice || line.value("notice").toString() == "Storage Too Low";
    }
    EXPECT_TRUE(sawNotice);
}

TEST_F(CommandConsoleTest, DeleteUnknownRecordingFails) {
    console_->handleLine("delete nope");
    EXPECT_FALSE(response("delete").value("ok").toBool());
    console_->handleLine("delete");
    EXPECT_FALSE(response("delete").value("ok").toBool());
}

TEST_F(CommandConsoleTest, CleanupReportsCounts) {
    console_->handleLine("cleanup");
    const QJsonObject reply = response("cleanup");
    EXPECT_TRUE(reply.value("ok").toBool());
    EXPECT_EQ(reply.value("deleted_expired_count").toInt(), 0);
    EXPECT_EQ(reply.value("remaining_count").toInt(), 0);
}

TEST_F(CommandConsoleTest, PermissionReportsStateAndOpensSettings) {
    permission_.current = {false, false};
    console_->handleLine("permission");
    QJsonObject reply = response("permission");
    EXPECT_TRUE(reply.value("ok").toBool());
    EXPECT_FALSE(reply.value("granted").toBool());
    EXPECT_FALSE(reply.value("can_ask_again").toBool());
    EXPECT_EQ(permission_.settingsCalls, 0);

    console_->handleLine("permission settings");
    reply = response("permission");
    EXPECT_TRUE(reply.value("ok").toBool());
    EXPECT_TRUE(reply.value("opened").toBool());
    EXPECT_EQ(permission_.settingsCalls, 1);

    console_->handleLine("permission reset");
    EXPECT_FALSE(response("permission").value("ok").toBool());
    EXPECT_EQ(permission_.settingsCalls, 1);
}

TEST_F(CommandConsoleTest, PermissionSettingsFailureIsReported) {
    permission_.settingsResult = false;
    console_->handleLine("permission settings");
    EXPECT_FALSE(response("permission").value("ok").toBool());
    EXPECT_EQ(permission_.settingsCalls, 1);
}

TEST_F(CommandConsoleTest, QuitEmitsSignal) {
    int quits = 0;
    QObject::connect(console_.get(), &CommandConsole::quitRequested, [&quits]() { ++quits; });
    console_->handleLine("quit");
    console_->handleLine("EXIT");
    EXPECT_EQ(quits, 2);
}
