#pragma once

#include <QString>

namespace sacore {

// Keeps the host awake while a session is live. Best effort: failures are
// reported through the return value and never stop a recording.
class KeepAlive {
public:
    virtual ~KeepAlive() = default;

    virtual bool acquire(const QString& reason) = 0;
    virtual void release() = 0;
    [[nodiscard]] virtual bool isHeld() const = 0;
};

class NoopKeepAlive final : public KeepAlive {
public:
    bool acquire(const QString& reason) override {
        Q_UNUSED(reason);
        held_ = true;
        return true;
    }
    void release() override { held_ = false; }
    [[nodiscard]] bool isHeld() const override { return held_; }

private:
    bool held_ = false;
};

}  // namespace sacore
