#pragma once

#include "sacore/permission_gate.hpp"

namespace sacore {

// QMicrophonePermission on the running QCoreApplication. request() waits
// for the platform answer for at most |requestTimeoutMs|.
class QtMicrophonePermission final : public PermissionGate {
public:
    explicit QtMicrophonePermission(int requestTimeoutMs = 60000);

    [[nodiscard]] PermissionState state() const override;
    PermissionState request() override;
    bool openSystemSettings() override;

private:
    int requestTimeoutMs_;
};

}  // namespace sacore
