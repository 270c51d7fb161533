#pragma once

#include "Amount.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Баланс пользователя по одному активу (производное значение)
 */
struct Balance {
    std::string assetTypeCode;
    std::string accountId;
    Amount amount;
};

} // namespace ledger::domain
