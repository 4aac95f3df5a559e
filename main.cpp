#include "src/CommandHost.hpp"
#include "src/Counter.hpp"
#include "src/Journal.hpp"
#include "src/StateFile.hpp"
#include "src/TallyConfig.hpp"
#include "src/utils/WorkerThread.hpp"
#include "src/utils/logging.hpp"

#include <QCoreApplication>
#include <QFile>
#include <QTextStream>

#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>


int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("tally");
    QCoreApplication::setApplicationVersion("1.0.0");

    qRegisterMetaType<ChangeRecord>();

    QCommandLineParser parser;
    parser.setApplicationDescription("Bounded counter driven by text commands on stdin.");
    parser.addHelpOption();
    parser.addVersionOption();
    TallyConfig::add_options(parser);
    parser.process(app);

    TallyConfig config;
    std::unique_ptr<StateFile> state_file;
    std::optional<quint64> restored;
    try {
        config = TallyConfig::from_parser(parser);
        set_verbose_logging(config.verbose);

        if (!config.state_file.isEmpty()) {
            state_file = std::make_unique<StateFile>(config.state_file);
            restored = state_file->load();
        }
    } catch (const std::runtime_error &error) {
        std::cerr << "tally: " << error.what() << std::endl;
        return 1;
    }

    const quint64 start = restored.value_or(config.initial);
    qCInfo(lcTally) << "starting at" << start << (restored ? "(restored)" : "");

    Counter counter(std::make_shared<SystemClock>(), start);

    QFile journal_file;
    std::unique_ptr<Journal> journal;
    if (!config.journal.isEmpty()) {
        journal_file.setFileName(config.journal);
        if (!journal_file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::cerr << "tally: cannot open journal " << config.journal.toStdString() << ": "
                      << journal_file.errorString().toStdString() << std::endl;
            return 1;
        }
        journal = std::make_unique<Journal>(&journal_file);
    }

    // Declared last so it stops before the listeners it owns are destroyed.
    WorkerThread listeners;

    if (journal) {
        listeners.adopt(&journal_file);
        listeners.adopt(journal.get());
        journal->attach(&counter, Qt::QueuedConnection);
    }

    if (state_file) {
        listeners.adopt(state_file.get());
        state_file->attach(&counter, Qt::QueuedConnection);
    }

    QTextStream in(stdin);
    QTextStream out(stdout);

    CommandHost host(&counter);
    host.run(in, out);

    listeners.stop();

    if (journal && journal->failed() > 0) {
        qCWarning(lcTally) << journal->failed() << "change records were not journaled";
    }

    return 0;
}
