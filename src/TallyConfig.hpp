#pragma once

#include <QCommandLineParser>
#include <QString>

#include <json/value.h>


/**
 * Host configuration. Sources are applied in order, later wins:
 * defaults, the JSON file named by --config, then the other command line
 * options. Unknown JSON keys are ignored; known keys with the wrong type
 * throw std::runtime_error.
 */
struct TallyConfig {
    quint64 initial = 0;
    QString state_file{};
    QString journal{};
    bool verbose = false;

    TallyConfig() = default;

    void merge_json(const Json::Value &root);

    void merge_file(const QString &path);

    static void add_options(QCommandLineParser &parser);

    [[nodiscard]] static TallyConfig from_parser(const QCommandLineParser &parser);
};
