#include "CommandHost.hpp"

#include "Counter.hpp"
#include "utils/logging.hpp"

#include <QRegularExpression>

#include <optional>


static std::optional<quint64> parse_operand(const QStringList &args) {
    if (args.size() != 1) {
        return std::nullopt;
    }

    // operands are unsigned, no sign allowed
    if (args[0].startsWith('-')) {
        return std::nullopt;
    }

    bool ok = false;
    const quint64 value = args[0].toULongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

static QString ok_reply(quint64 value) {
    return QStringLiteral("ok %1").arg(value);
}


CommandHost::CommandHost(Counter *counter, QObject *parent) : QObject(parent), m_counter(counter) {
}

QString CommandHost::execute(const QString &line) {
    const QString trimmed = line.trimmed();
    if (trimmed.isEmpty() || trimmed.startsWith('#')) {
        return {};
    }

    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    QStringList parts = trimmed.split(whitespace, Qt::SkipEmptyParts);
    const QString verb = parts.takeFirst().toLower();

    if (verb == QLatin1String("quit")) {
        m_finished = true;
        emit quitRequested();
        return {};
    }

    if (m_counter == nullptr) {
        return QStringLiteral("error counter is gone");
    }

    try {
        return dispatch(verb, parts);
    } catch (const CounterError &error) {
        qCDebug(lcTally) << "command" << trimmed << "failed:" << error.what();
        if (error.kind() == CounterError::Kind::Overflow) {
            return QStringLiteral("error overflow");
        }
        return QStringLiteral("error underflow");
    }
}

QString CommandHost::dispatch(const QString &verb, const QStringList &args) {
    const bool takes_operand = verb == QLatin1String("add") || verb == QLatin1String("sub") ||
                               verb == QLatin1String("set");

    if (takes_operand) {
        auto operand = parse_operand(args);
        if (!operand) {
            return QStringLiteral("error %1 expects one unsigned integer").arg(verb);
        }

        if (verb == QLatin1String("add")) {
            return ok_reply(m_counter->increase_by_value(*operand));
        }
        if (verb == QLatin1String("sub")) {
            return ok_reply(m_counter->decrease_by_value(*operand));
        }
        return ok_reply(m_counter->set(*operand));
    }

    if (!args.isEmpty()) {
        return QStringLiteral("error %1 takes no arguments").arg(verb);
    }

    if (verb == QLatin1String("inc")) {
        return ok_reply(m_counter->increase_by_one());
    }
    if (verb == QLatin1String("dec")) {
        return ok_reply(m_counter->decrease_by_one());
    }
    if (verb == QLatin1String("reset")) {
        return ok_reply(m_counter->reset());
    }
    if (verb == QLatin1String("get")) {
        return QStringLiteral("value %1").arg(m_counter->get());
    }

    qCWarning(lcTally) << "unknown command" << verb;
    return QStringLiteral("error unknown command '%1'").arg(verb);
}

void CommandHost::run(QTextStream &in, QTextStream &out) {
    QString line;
    while (!m_finished && in.readLineInto(&line)) {
        const QString reply = execute(line);
        if (!reply.isEmpty()) {
            out << reply << Qt::endl;
        }
    }
}
