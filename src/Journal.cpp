#include "Journal.hpp"

#include "Counter.hpp"
#include "utils/json.hpp"
#include "utils/logging.hpp"

#include <QFileDevice>

#include <json/value.h>

#include <stdexcept>


Journal::Journal(QIODevice *device, QObject *parent) : QObject(parent), m_device(device) {
}

void Journal::attach(Counter *counter, Qt::ConnectionType type) {
    connect(counter, &Counter::changed, this, &Journal::append, type);
}

void Journal::append(const ChangeRecord &record) {
    if (m_device == nullptr || !m_device->isWritable()) {
        qCWarning(lcTally) << "journal device is not writable, dropping record" << record.value();
        m_failed++;
        return;
    }

    std::string line = to_line(record);
    line.push_back('\n');

    const auto size = static_cast<qint64>(line.size());
    if (m_device->write(line.data(), size) != size) {
        qCWarning(lcTally) << "journal write failed:" << m_device->errorString();
        m_failed++;
        return;
    }

    // QFileDevice buffers internally
    if (auto *const file = qobject_cast<QFileDevice *>(m_device.data())) {
        if (!file->flush()) {
            qCWarning(lcTally) << "journal flush failed:" << file->errorString();
            m_failed++;
            return;
        }
    }

    m_written++;
}

std::string Journal::to_line(const ChangeRecord &record) {
    Json::Value root{Json::objectValue};
    root["direction"] = to_string(record.direction()).toStdString();
    root["timestamp"] = Json::UInt64{record.timestamp()};
    root["value"] = Json::UInt64{record.value()};

    return to_compact_json(root);
}

ChangeRecord Journal::parse_line(const std::string &line) {
    const Json::Value root = parse_json(line);
    if (!root.isObject()) {
        throw std::runtime_error("journal line is not an object");
    }

    const Json::Value &direction = root["direction"];
    const Json::Value &timestamp = root["timestamp"];
    const Json::Value &value = root["value"];

    if (!direction.isString()) {
        throw std::runtime_error("journal line: 'direction' must be a string");
    }
    if (!is_unsigned_integer(timestamp)) {
        throw std::runtime_error("journal line: 'timestamp' must be an unsigned integer");
    }
    if (!is_unsigned_integer(value)) {
        throw std::runtime_error("journal line: 'value' must be an unsigned integer");
    }

    auto parsed = direction_from_string(QString::fromStdString(direction.asString()));
    if (!parsed) {
        throw std::runtime_error("journal line: unknown direction '" + direction.asString() + "'");
    }

    return ChangeRecord{value.asUInt64(), timestamp.asUInt64(), *parsed};
}
