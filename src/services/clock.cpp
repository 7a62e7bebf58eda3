#include "sacore/clock.hpp"

#include <QDateTime>

namespace sacore {

qint64 SystemClock::nowMs() const {
    return QDateTime::currentMSecsSinceEpoch();
}

}  // namespace sacore
