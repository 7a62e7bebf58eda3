#include "sacore/logging.hpp"

Q_LOGGING_CATEGORY(lcRecorder, "sacore.recorder")
Q_LOGGING_CATEGORY(lcRotation, "sacore.rotation")
Q_LOGGING_CATEGORY(lcStorage, "sacore.storage")
Q_LOGGING_CATEGORY(lcRecovery, "sacore.recovery")
Q_LOGGING_CATEGORY(lcRetention, "sacore.retention")
Q_LOGGING_CATEGORY(lcController, "sacore.controller")
Q_LOGGING_CATEGORY(lcCapture, "sacore.capture")
Q_LOGGING_CATEGORY(lcConsole, "sacore.console")
