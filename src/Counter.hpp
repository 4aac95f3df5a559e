#pragma once

#include "ChangeRecord.hpp"
#include "CounterError.hpp"
#include "utils/Clock.hpp"

#include <QObject>
#include <QRecursiveMutex>

#include <limits>
#include <memory>


/**
 * Bounded unsigned counter. Every successful mutation emits changed() with
 * the post-mutation value; rejected mutations throw CounterError and leave
 * the value untouched.
 *
 * All operations hold one mutex across read, check, write and emit. A slot
 * connected directly may read the counter, but mutating it from inside
 * changed() or valueChanged() throws std::logic_error and changes nothing.
 */
class Counter : public QObject {
Q_OBJECT

    Q_PROPERTY(quint64 value READ get NOTIFY valueChanged)

public:
    static constexpr quint64 MAX = std::numeric_limits<quint64>::max();

    explicit Counter(std::shared_ptr<Clock> clock = nullptr, quint64 initial = 0, QObject *parent = nullptr);

    ~Counter() override = default;

    [[nodiscard]] quint64 get() const;

    quint64 increase_by_one();

    quint64 increase_by_value(quint64 value);

    quint64 decrease_by_one();

    quint64 decrease_by_value(quint64 value);

    // Always reported as Decreased, even when the value already was 0.
    quint64 reset();

    // Always reported as Increased, whatever the previous value was.
    quint64 set(quint64 value);

signals:

    void changed(const ChangeRecord &record);

    void valueChanged(quint64 value);

private:
    mutable QRecursiveMutex m_mutex;
    std::shared_ptr<Clock> m_clock;
    quint64 m_value;
    bool m_publishing = false;

    void check_not_publishing(const char *operation) const;

    quint64 publish(ChangeDirection direction);
};
