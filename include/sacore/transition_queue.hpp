#pragma once

#include <QQueue>

#include <functional>

namespace sacore {

// FIFO of state transitions. An operation submitted while another one runs
// is appended and executed after it, never nested.
class TransitionQueue {
public:
    using Operation = std::function<void()>;

    void submit(Operation operation);

    [[nodiscard]] bool isDraining() const { return draining_; }
    [[nodiscard]] int pendingCount() const { return static_cast<int>(operations_.size()); }

private:
    void drain();

    QQueue<Operation> operations_;
    bool draining_ = false;
};

}  // namespace sacore
