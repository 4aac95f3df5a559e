#pragma once

#include <QObject>
#include <QPointer>
#include <QString>
#include <QTextStream>


class Counter;

/**
 * Line protocol over a Counter, one command per line:
 *
 *   inc | add <v> | dec | sub <v> | reset | set <v>   ->  ok <value>
 *   get                                               ->  value <value>
 *   quit
 *
 * Rejected operations reply "error overflow" / "error underflow", malformed
 * lines "error <message>". Blank lines and '#' comments produce no reply.
 */
class CommandHost : public QObject {
Q_OBJECT

public:
    explicit CommandHost(Counter *counter, QObject *parent = nullptr);

    ~CommandHost() override = default;

    [[nodiscard]] QString execute(const QString &line);

    // Returns after "quit" or at end of input.
    void run(QTextStream &in, QTextStream &out);

    [[nodiscard]] bool finished() const {
        return m_finished;
    }

signals:

    void quitRequested();

private:
    QPointer<Counter> m_counter;
    bool m_finished = false;

    QString dispatch(const QString &verb, const QStringList &args);
};
