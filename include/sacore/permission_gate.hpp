#pragma once

namespace sacore {

struct PermissionState {
    bool granted = false;
    bool canAskAgain = true;
};

class PermissionGate {
public:
    virtual ~PermissionGate() = default;

    [[nodiscard]] virtual PermissionState state() const = 0;
    virtual PermissionState request() = 0;
    virtual bool openSystemSettings() = 0;
};

}  // namespace sacore
