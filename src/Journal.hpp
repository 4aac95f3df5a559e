#pragma once

#include "ChangeRecord.hpp"

#include <QIODevice>
#include <QObject>
#include <QPointer>

#include <string>


class Counter;

/**
 * Appends every change record of the attached counters to a device, one
 * compact JSON object per line:
 *
 *   {"direction":"increased","timestamp":1700000000,"value":10}
 *
 * The device is not owned and must already be open for writing. Write
 * failures are logged and dropped; they never reach the counter. The host
 * moves the journal and its device to a worker thread and attaches with
 * Qt::QueuedConnection so that file I/O stays off the mutation path.
 */
class Journal : public QObject {
Q_OBJECT

public:
    explicit Journal(QIODevice *device, QObject *parent = nullptr);

    ~Journal() override = default;

    void attach(Counter *counter, Qt::ConnectionType type = Qt::AutoConnection);

    [[nodiscard]] quint64 written() const {
        return m_written;
    }

    [[nodiscard]] quint64 failed() const {
        return m_failed;
    }

    [[nodiscard]] static std::string to_line(const ChangeRecord &record);

    // Throws std::runtime_error on malformed lines.
    [[nodiscard]] static ChangeRecord parse_line(const std::string &line);

public slots:

    void append(const ChangeRecord &record);

private:
    QPointer<QIODevice> m_device;
    quint64 m_written = 0;
    quint64 m_failed = 0;
};
