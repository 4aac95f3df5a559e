#include "ChangeRecord.hpp"

#include <cassert>


QString to_string(ChangeDirection direction) {
    switch (direction) {
        case ChangeDirection::Increased:
            return QStringLiteral("increased");
        case ChangeDirection::Decreased:
            return QStringLiteral("decreased");
    }

    assert(false);
    return {};
}

std::optional<ChangeDirection> direction_from_string(const QString &str) {
    if (str == QLatin1String("increased")) {
        return ChangeDirection::Increased;
    }
    if (str == QLatin1String("decreased")) {
        return ChangeDirection::Decreased;
    }

    return std::nullopt;
}
