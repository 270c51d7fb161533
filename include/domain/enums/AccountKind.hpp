#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Вид счёта
 */
enum class AccountKind {
    USER,       ///< Счёт пользователя
    SYSTEM      ///< Казначейство (контрагент системы по активу)
};

inline std::string toString(AccountKind kind) {
    switch (kind) {
        case AccountKind::USER:   return "USER";
        case AccountKind::SYSTEM: return "SYSTEM";
        default: return "UNKNOWN";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountKind parseAccountKind(const std::string& str) {
    if (str == "USER")   return AccountKind::USER;
    if (str == "SYSTEM") return AccountKind::SYSTEM;
    throw std::invalid_argument("Unknown account kind: " + str);
}

} // namespace ledger::domain
