#include "sacore/transition_queue.hpp"

#include <exception>
#include <utility>

#include "sacore/logging.hpp"

namespace sacore {

namespace {

class DrainGuard {
public:
    explicit DrainGuard(bool& flag)
        : flag_(flag) {
        flag_ = true;
    }
    ~DrainGuard() { flag_ = false; }

    DrainGuard(const DrainGuard&) = delete;
    DrainGuard& operator=(const DrainGuard&) = delete;

private:
    bool& flag_;
};

}  // namespace

void TransitionQueue::submit(Operation operation) {
    if (!operation) {
        return;
    }
    operations_.enqueue(std::move(operation));
    if (!draining_) {
        drain();
    }
}

void TransitionQueue::drain() {
    DrainGuard guard(draining_);
    while (!operations_.isEmpty()) {
        Operation next = operations_.dequeue();
        try {
            next();
        } catch (const std::exception& error) {
            qCCritical(lcRecorder) << "Recorder transition failed:" << error.what();
        }
    }
}

}  // namespace sacore
