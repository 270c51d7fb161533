#pragma once

#include "enums/AccountKind.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Счёт пользователя или казначейства в разрезе актива
 *
 * Баланс здесь НЕ хранится: он всегда считается по журналу проводок.
 * version растёт на единицу при каждой проводке по счёту и служит
 * только для диагностики, от гонок защищает блокировка строки.
 */
struct Account {
    std::string id;                 ///< "<userId>:<assetTypeCode>"
    std::string userId;
    AccountKind kind = AccountKind::USER;
    std::string assetTypeCode;
    int64_t version = 0;
    Timestamp createdAt;

    /// Коды активов состоят из [A-Z0-9_], двоеточия в них не бывает
    static constexpr char ID_SEPARATOR = ':';

    /**
     * @brief Детерминированный ID счёта
     *
     * Разделитель не встречается в коде актива, поэтому ID однозначно
     * делится по последнему ':' и разные пары не совпадают.
     */
    static std::string makeId(const std::string& userId, const std::string& assetTypeCode) {
        return userId + ID_SEPARATOR + assetTypeCode;
    }
};

} // namespace ledger::domain
