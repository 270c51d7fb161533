#pragma once

#include "enums/TransactionType.hpp"
#include "enums/TransactionStatus.hpp"
#include "Amount.hpp"
#include "Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ledger::domain {

/**
 * @brief Транзакция (одна на уникальный ключ идемпотентности)
 *
 * metadata хранится и возвращается как есть, движок её не читает.
 */
struct Transaction {
    std::string id;                 ///< "txn_xxxxxxxxxxxxxxxx"
    TransactionType type = TransactionType::TOPUP;
    TransactionStatus status = TransactionStatus::PENDING;
    std::string userId;
    std::string assetTypeCode;
    Amount amount;
    std::string idempotencyKey;
    nlohmann::json metadata;        ///< null, если не передана
    Timestamp createdAt;
};

} // namespace ledger::domain
