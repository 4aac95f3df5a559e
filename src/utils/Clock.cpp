#include "Clock.hpp"

#include <QDateTime>


quint64 SystemClock::now() const {
    const qint64 secs = QDateTime::currentSecsSinceEpoch();
    return secs < 0 ? 0 : static_cast<quint64>(secs);
}
