#include "logging.hpp"

Q_LOGGING_CATEGORY(lcTally, "tally", QtInfoMsg)

void set_verbose_logging(bool verbose) {
    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("tally.debug=true"));
    } else {
        QLoggingCategory::setFilterRules(QStringLiteral("tally.debug=false"));
    }
}
