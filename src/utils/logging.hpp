#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTally)

void set_verbose_logging(bool verbose);
