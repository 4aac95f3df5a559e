#pragma once

#include <QtGlobal>

#include <atomic>


// Source of change record timestamps, seconds since the Unix epoch.
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual quint64 now() const = 0;

    Clock(const Clock &other) = delete;

    Clock &operator=(const Clock &other) = delete;

protected:
    Clock() = default;
};


class SystemClock : public Clock {
public:
    SystemClock() = default;

    [[nodiscard]] quint64 now() const override;
};


class ManualClock : public Clock {
public:
    explicit ManualClock(quint64 start = 0) : m_now(start) {}

    [[nodiscard]] quint64 now() const override {
        return m_now.load();
    }

    void set(quint64 now) {
        m_now.store(now);
    }

    void advance(quint64 seconds) {
        m_now.fetch_add(seconds);
    }

private:
    std::atomic<quint64> m_now;
};
