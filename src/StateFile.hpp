#pragma once

#include <QObject>
#include <QString>

#include <optional>


class Counter;

// Single scalar persisted as {"value": <uint64>}.
class StateFile : public QObject {
Q_OBJECT

public:
    explicit StateFile(QString path, QObject *parent = nullptr);

    ~StateFile() override = default;

    [[nodiscard]] const QString &path() const {
        return m_path;
    }

    // Empty when the file does not exist. Throws std::runtime_error when it
    // cannot be read or does not hold a value.
    [[nodiscard]] std::optional<quint64> load() const;

    // Saves after every change of the counter's value. Queued connections
    // deliver in order, so the last save holds the latest value.
    void attach(Counter *counter, Qt::ConnectionType type = Qt::AutoConnection);

public slots:

    // Replaces the file atomically. Failures are logged, never thrown.
    bool save(quint64 value);

private:
    QString m_path;
};
