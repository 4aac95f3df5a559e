#include "TallyConfig.hpp"

#include "utils/json.hpp"

#include <QFile>

#include <stdexcept>
#include <string>


static quint64 parse_value(const QString &text, const char *what) {
    const QString trimmed = text.trimmed();
    bool ok = false;
    const quint64 value = trimmed.toULongLong(&ok);
    if (!ok || trimmed.startsWith('-')) {
        throw std::runtime_error(std::string(what) + ": '" + text.toStdString() + "' is not an unsigned integer");
    }
    return value;
}

void TallyConfig::merge_json(const Json::Value &root) {
    if (!root.isObject()) {
        throw std::runtime_error("config: top level must be an object");
    }

    if (root.isMember("initial")) {
        const Json::Value &value = root["initial"];
        if (!is_unsigned_integer(value)) {
            throw std::runtime_error("config: 'initial' must be an unsigned integer");
        }
        initial = value.asUInt64();
    }

    if (root.isMember("state_file")) {
        const Json::Value &value = root["state_file"];
        if (!value.isString()) {
            throw std::runtime_error("config: 'state_file' must be a string");
        }
        state_file = QString::fromStdString(value.asString());
    }

    if (root.isMember("journal")) {
        const Json::Value &value = root["journal"];
        if (!value.isString()) {
            throw std::runtime_error("config: 'journal' must be a string");
        }
        journal = QString::fromStdString(value.asString());
    }

    if (root.isMember("verbose")) {
        const Json::Value &value = root["verbose"];
        if (!value.isBool()) {
            throw std::runtime_error("config: 'verbose' must be a boolean");
        }
        verbose = value.asBool();
    }
}

void TallyConfig::merge_file(const QString &path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw std::runtime_error("cannot open config " + path.toStdString() + ": " +
                                 file.errorString().toStdString());
    }

    merge_json(parse_json(file.readAll().toStdString()));
}

void TallyConfig::add_options(QCommandLineParser &parser) {
    parser.addOption({"config", "JSON configuration file.", "path"});
    parser.addOption({"initial", "Starting value when no state file exists.", "value"});
    parser.addOption({"state", "File holding the current value.", "path"});
    parser.addOption({"journal", "Append change records to this file.", "path"});
    parser.addOption({{"v", "verbose"}, "Log every mutation."});
}

TallyConfig TallyConfig::from_parser(const QCommandLineParser &parser) {
    TallyConfig config;

    if (parser.isSet("config")) {
        config.merge_file(parser.value("config"));
    }
    if (parser.isSet("initial")) {
        config.initial = parse_value(parser.value("initial"), "--initial");
    }
    if (parser.isSet("state")) {
        config.state_file = parser.value("state");
    }
    if (parser.isSet("journal")) {
        config.journal = parser.value("journal");
    }
    if (parser.isSet("verbose")) {
        config.verbose = true;
    }

    return config;
}
