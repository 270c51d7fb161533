#pragma once

#include "domain/Transaction.hpp"
#include "domain/TransactionRequest.hpp"
#include "domain/LedgerEntry.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Запись в леджер: создание и чтение транзакций
 */
class ITransactionService {
public:
    virtual ~ITransactionService() = default;

    /**
     * @brief Провести транзакцию
     *
     * Повтор с тем же ключом идемпотентности возвращает уже
     * существующую транзакцию без новых проводок.
     *
     * @throws domain::ValidationError
     * @throws domain::InsufficientBalanceError
     * @throws domain::ConflictError (retryable)
     * @throws domain::IntegrityError
     */
    virtual domain::Transaction process(const domain::TransactionRequest& request) = 0;

    virtual std::optional<domain::Transaction> getTransaction(const std::string& transactionId) = 0;

    virtual std::vector<domain::LedgerEntry> getEntries(const std::string& transactionId) = 0;
};

} // namespace ledger::ports::input
