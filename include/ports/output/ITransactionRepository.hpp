#pragma once

#include "domain/Transaction.hpp"
#include <string>
#include <optional>

namespace ledger::ports::output {

/**
 * @brief Индекс идемпотентности и чтение транзакций
 *
 * Уникальность ключа обеспечивает ограничение на таблице транзакций.
 */
class ITransactionRepository {
public:
    virtual ~ITransactionRepository() = default;

    virtual std::optional<domain::Transaction> findByIdempotencyKey(const std::string& key) = 0;
    virtual std::optional<domain::Transaction> findByTransactionId(const std::string& transactionId) = 0;
};

} // namespace ledger::ports::output
