#include "CounterError.hpp"

#include <string>


static std::string describe(CounterError::Kind kind, quint64 current, quint64 operand) {
    if (kind == CounterError::Kind::Overflow) {
        return "counter overflow: " + std::to_string(current) + " + " + std::to_string(operand);
    }

    return "counter underflow: " + std::to_string(current) + " - " + std::to_string(operand);
}

CounterError::CounterError(Kind kind, quint64 current, quint64 operand)
        : std::runtime_error(describe(kind, current, operand)),
          m_kind(kind),
          m_current(current),
          m_operand(operand) {
}
