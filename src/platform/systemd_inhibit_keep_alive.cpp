#include "sacore/systemd_inhibit_keep_alive.hpp"

#include "sacore/logging.hpp"

namespace sacore {

SystemdInhibitKeepAlive::SystemdInhibitKeepAlive(QString program, int startTimeoutMs)
    : program_(std::move(program)),
      startTimeoutMs_(startTimeoutMs) {}

SystemdInhibitKeepAlive::~SystemdInhibitKeepAlive() {
    release();
}

QStringList SystemdInhibitKeepAlive::inhibitArguments(const QString& reason) {
    return {
        "--what=sleep:idle",
        "--who=safety-audio",
        QString("--why=%1").arg(reason),
        "--mode=block",
        "sleep",
        "infinity",
    };
}

bool SystemdInhibitKeepAlive::acquire(const QString& reason) {
    if (isHeld()) {
        return true;
    }
    process_ = std::make_unique<QProcess>();
    process_->start(program_, inhibitArguments(reason));
    if (!process_->waitForStarted(startTimeoutMs_)) {
        qCWarning(lcRecorder) << "Unable to start" << program_ << process_->errorString();
        process_.reset();
        return false;
    }
    qCDebug(lcRecorder) << "Sleep inhibitor held, pid" << process_->processId();
    return true;
}

void SystemdInhibitKeepAlive::release() {
    if (!process_) {
        return;
    }
    if (process_->state() != QProcess::NotRunning) {
        process_->terminate();
        if (!process_->waitForFinished(500)) {
            process_->kill();
            process_->waitForFinished(500);
        }
    }
    process_.reset();
}

bool SystemdInhibitKeepAlive::isHeld() const {
    return process_ && process_->state() == QProcess::Running;
}

}  // namespace sacore
