#include "StateFile.hpp"

#include "Counter.hpp"
#include "utils/json.hpp"
#include "utils/logging.hpp"

#include <QFile>
#include <QSaveFile>

#include <json/value.h>

#include <stdexcept>
#include <utility>


StateFile::StateFile(QString path, QObject *parent) : QObject(parent), m_path(std::move(path)) {
}

std::optional<quint64> StateFile::load() const {
    QFile file(m_path);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        throw std::runtime_error("cannot open state file " + m_path.toStdString() + ": " +
                                 file.errorString().toStdString());
    }

    const QByteArray data = file.readAll();
    const Json::Value root = parse_json(data.toStdString());

    const Json::Value &value = root.isObject() ? root["value"] : Json::Value{};
    if (!is_unsigned_integer(value)) {
        throw std::runtime_error("state file " + m_path.toStdString() + " has no unsigned 'value'");
    }

    return value.asUInt64();
}

void StateFile::attach(Counter *counter, Qt::ConnectionType type) {
    connect(counter, &Counter::valueChanged, this, &StateFile::save, type);
}

bool StateFile::save(quint64 value) {
    Json::Value root{Json::objectValue};
    root["value"] = Json::UInt64{value};
    const std::string text = to_styled_json(root) + "\n";

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcTally) << "cannot open state file" << m_path << ":" << file.errorString();
        return false;
    }

    const auto size = static_cast<qint64>(text.size());
    if (file.write(text.data(), size) != size) {
        qCWarning(lcTally) << "cannot write state file" << m_path << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        qCWarning(lcTally) << "cannot commit state file" << m_path << ":" << file.errorString();
        return false;
    }

    qCDebug(lcTally) << "saved" << value << "to" << m_path;
    return true;
}
