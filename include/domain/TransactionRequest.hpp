#pragma once

#include "enums/TransactionType.hpp"
#include "Amount.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ledger::domain {

/**
 * @brief Намерение провести транзакцию (вход движка)
 */
struct TransactionRequest {
    TransactionType type = TransactionType::TOPUP;
    std::string userId;
    std::string assetTypeCode;
    Amount amount;
    std::string idempotencyKey;
    nlohmann::json metadata;
};

} // namespace ledger::domain
