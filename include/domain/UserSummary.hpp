#pragma once

#include <cstdint>
#include <string>

namespace ledger::domain {

/**
 * @brief Пользователь и число его счетов (счета казначейства не входят)
 */
struct UserSummary {
    std::string userId;
    int64_t accountCount = 0;
};

} // namespace ledger::domain
