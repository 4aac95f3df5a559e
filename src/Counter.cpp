#include "Counter.hpp"

#include "utils/logging.hpp"

#include <QMutexLocker>
#include <QScopeGuard>

#include <stdexcept>
#include <string>
#include <utility>


Counter::Counter(std::shared_ptr<Clock> clock, quint64 initial, QObject *parent)
        : QObject(parent), m_clock(std::move(clock)), m_value(initial) {
    if (m_clock == nullptr) {
        m_clock = std::make_shared<SystemClock>();
    }
}

quint64 Counter::get() const {
    QMutexLocker locker(&m_mutex);
    return m_value;
}

quint64 Counter::increase_by_one() {
    QMutexLocker locker(&m_mutex);
    check_not_publishing("increase_by_one");
    if (m_value == MAX) {
        qCDebug(lcTally) << "rejected increase_by_one at" << m_value;
        throw CounterError(CounterError::Kind::Overflow, m_value, 1);
    }

    m_value += 1;
    return publish(ChangeDirection::Increased);
}

quint64 Counter::increase_by_value(quint64 value) {
    QMutexLocker locker(&m_mutex);
    check_not_publishing("increase_by_value");
    // unsigned addition wraps, so a sum below the old value means overflow
    const quint64 sum = m_value + value;
    if (sum < m_value) {
        qCDebug(lcTally) << "rejected increase_by_value" << value << "at" << m_value;
        throw CounterError(CounterError::Kind::Overflow, m_value, value);
    }

    m_value = sum;
    return publish(ChangeDirection::Increased);
}

quint64 Counter::decrease_by_one() {
    QMutexLocker locker(&m_mutex);
    check_not_publishing("decrease_by_one");
    if (m_value == 0) {
        qCDebug(lcTally) << "rejected decrease_by_one at 0";
        throw CounterError(CounterError::Kind::Underflow, m_value, 1);
    }

    m_value -= 1;
    return publish(ChangeDirection::Decreased);
}

quint64 Counter::decrease_by_value(quint64 value) {
    QMutexLocker locker(&m_mutex);
    check_not_publishing("decrease_by_value");
    if (m_value < value) {
        qCDebug(lcTally) << "rejected decrease_by_value" << value << "at" << m_value;
        throw CounterError(CounterError::Kind::Underflow, m_value, value);
    }

    m_value -= value;
    return publish(ChangeDirection::Decreased);
}

quint64 Counter::reset() {
    QMutexLocker locker(&m_mutex);
    check_not_publishing("reset");
    m_value = 0;
    return publish(ChangeDirection::Decreased);
}

quint64 Counter::set(quint64 value) {
    QMutexLocker locker(&m_mutex);
    check_not_publishing("set");
    m_value = value;
    return publish(ChangeDirection::Increased);
}

// Caller holds m_mutex, so only the publishing thread can observe the flag.
void Counter::check_not_publishing(const char *operation) const {
    if (m_publishing) {
        qCWarning(lcTally) << "rejected" << operation << "from a change listener";
        throw std::logic_error(std::string("counter: ") + operation + " called while publishing a change");
    }
}

// Caller holds m_mutex.
quint64 Counter::publish(ChangeDirection direction) {
    const ChangeRecord record{m_value, m_clock->now(), direction};

    qCDebug(lcTally) << to_string(direction) << record.value() << "at" << record.timestamp();

    m_publishing = true;
    const auto done = qScopeGuard([this]() { m_publishing = false; });

    emit changed(record);
    emit valueChanged(record.value());

    return record.value();
}
