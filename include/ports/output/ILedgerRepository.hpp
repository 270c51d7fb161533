#pragma once

#include "domain/Amount.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Transaction.hpp"
#include <string>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Журнал проводок: единственный источник балансов (чтение)
 *
 * Запись идёт только через IUnitOfWork::append.
 */
class ILedgerRepository {
public:
    virtual ~ILedgerRepository() = default;

    /**
     * @brief sum(DEBIT) - sum(CREDIT) по счёту
     */
    virtual domain::Amount balanceOf(const std::string& accountId) = 0;

    /**
     * @brief Транзакции пользователя, новые первыми (created_at DESC, id DESC)
     */
    virtual std::vector<domain::Transaction> historyOf(
        const std::string& userId, int limit, int offset) = 0;

    virtual std::vector<domain::LedgerEntry> entriesOf(const std::string& transactionId) = 0;

    /**
     * @brief Сумма балансов всех счетов актива (инвариант: ноль)
     */
    virtual domain::Amount totalOf(const std::string& assetTypeCode) = 0;
};

} // namespace ledger::ports::output
