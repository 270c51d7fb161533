#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Сторона проводки
 *
 * DEBIT увеличивает баланс счёта, CREDIT уменьшает.
 */
enum class EntrySide {
    DEBIT,
    CREDIT
};

inline std::string toString(EntrySide side) {
    switch (side) {
        case EntrySide::DEBIT:  return "DEBIT";
        case EntrySide::CREDIT: return "CREDIT";
        default: return "UNKNOWN";
    }
}

inline EntrySide parseEntrySide(const std::string& str) {
    if (str == "DEBIT")  return EntrySide::DEBIT;
    if (str == "CREDIT") return EntrySide::CREDIT;
    throw std::invalid_argument("Unknown entry side: " + str);
}

} // namespace ledger::domain
