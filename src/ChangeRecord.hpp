#pragma once

#include <QMetaType>
#include <QString>

#include <cstdint>
#include <optional>


enum class ChangeDirection {
    Increased = 1,
    Decreased = 2,
};

[[nodiscard]] QString to_string(ChangeDirection direction);

[[nodiscard]] std::optional<ChangeDirection> direction_from_string(const QString &str);


// Immutable once built; copyable so it can travel through queued signals.
class ChangeRecord {
public:
    ChangeRecord() = default;

    ChangeRecord(quint64 value, quint64 timestamp, ChangeDirection direction)
            : m_value(value), m_timestamp(timestamp), m_direction(direction) {}

    [[nodiscard]] quint64 value() const {
        return m_value;
    }

    [[nodiscard]] quint64 timestamp() const {
        return m_timestamp;
    }

    [[nodiscard]] ChangeDirection direction() const {
        return m_direction;
    }

    [[nodiscard]] bool operator==(const ChangeRecord &other) const {
        return m_value == other.m_value && m_timestamp == other.m_timestamp && m_direction == other.m_direction;
    }

    [[nodiscard]] bool operator!=(const ChangeRecord &other) const {
        return !(*this == other);
    }

private:
    quint64 m_value = 0;
    quint64 m_timestamp = 0;
    ChangeDirection m_direction = ChangeDirection::Increased;
};

Q_DECLARE_METATYPE(ChangeRecord)
