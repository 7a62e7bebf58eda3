#include "sacore/qt_microphone_permission.hpp"

#include <QCoreApplication>
#include <QEventLoop>
#include <QPermissions>
#include <QProcess>
#include <QTimer>

#include "sacore/logging.hpp"

namespace sacore {

namespace {

PermissionState fromStatus(Qt::PermissionStatus status) {
    PermissionState state;
    state.granted = status == Qt::PermissionStatus::Granted;
    state.canAskAgain = status == Qt::PermissionStatus::Undetermined;
    return state;
}

}  // namespace

QtMicrophonePermission::QtMicrophonePermission(int requestTimeoutMs)
    : requestTimeoutMs_(requestTimeoutMs) {}

PermissionState QtMicrophonePermission::state() const {
    if (qApp == nullptr) {
        return {};
    }
    return fromStatus(qApp->checkPermission(QMicrophonePermission {}));
}

PermissionState QtMicrophonePermission::request() {
    if (qApp == nullptr) {
        return {};
    }
    const Qt::PermissionStatus current = qApp->checkPermission(QMicrophonePermission {});
    if (current != Qt::PermissionStatus::Undetermined) {
        return fromStatus(current);
    }

    Qt::PermissionStatus answered = Qt::PermissionStatus::Undetermined;
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    qApp->requestPermission(QMicrophonePermission {}, &loop, [&answered, &loop](const QPermission& permission) {
        answered = permission.status();
        loop.quit();
    });
    timeout.start(requestTimeoutMs_);
    if (answered == Qt::PermissionStatus::Undetermined) {
        loop.exec();
    }
    if (answered == Qt::PermissionStatus::Undetermined) {
        qCWarning(lcCapture) << "Microphone permission request timed out";
    }
    return fromStatus(answered);
}

bool QtMicrophonePermission::openSystemSettings() {
#if defined(Q_OS_MACOS)
    const bool opened = QProcess::startDetached(
        "open", {"x-apple.systempreferences:com.apple.preference.security?Privacy_Microphone"});
#elif defined(Q_OS_WIN)
    const bool opened = QProcess::startDetached("explorer.exe", {"ms-settings:privacy-microphone"});
#else
    const bool opened = false;
    qCWarning(lcCapture) << "Opening microphone settings is not supported on this platform";
#endif
    if (!opened) {
        qCWarning(lcCapture) << "Microphone settings could not be opened";
    }
    return opened;
}

}  // namespace sacore
