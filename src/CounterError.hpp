#pragma once

#include <QtGlobal>

#include <stdexcept>


class CounterError : public std::runtime_error {
public:
    enum class Kind {
        Overflow,
        Underflow,
    };

    CounterError(Kind kind, quint64 current, quint64 operand);

    [[nodiscard]] Kind kind() const {
        return m_kind;
    }

    // value held by the counter when the operation was rejected
    [[nodiscard]] quint64 current() const {
        return m_current;
    }

    [[nodiscard]] quint64 operand() const {
        return m_operand;
    }

private:
    Kind m_kind;
    quint64 m_current;
    quint64 m_operand;
};
