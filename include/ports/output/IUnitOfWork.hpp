#pragma once

#include "domain/Account.hpp"
#include "domain/Amount.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Transaction.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Атомарная единица работы (транзакция хранилища)
 *
 * Всё, что записано через append/insertTransaction, становится видимым
 * только после commit(). Деструктор без commit() откатывает работу
 * и освобождает блокировки.
 *
 * @example
 * ```cpp
 * auto uow = factory->begin();
 * uow->lockAccounts({"SYSTEM_TREASURY:GOLD_COINS", "user_001:GOLD_COINS"});
 * uow->insertTransaction(tx);
 * uow->append(pair);
 * uow->commit();
 * ```
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    /**
     * @brief Эксклюзивно заблокировать счета строго в переданном порядке
     *
     * Порядок не меняется: за него отвечает вызывающий.
     * @throws domain::LockTimeoutError если не дождались блокировки
     * @throws domain::IntegrityError если счёт не найден
     */
    virtual std::vector<domain::Account> lockAccounts(const std::vector<std::string>& orderedAccountIds) = 0;

    /**
     * @brief Баланс счёта внутри единицы работы (после блокировки)
     */
    virtual domain::Amount balanceOf(const std::string& accountId) = 0;

    /**
     * @throws domain::DuplicateIdempotencyKeyError если ключ уже занят
     */
    virtual void insertTransaction(const domain::Transaction& transaction) = 0;

    /**
     * @brief Добавить пару проводок и увеличить version обоих счетов
     */
    virtual void append(const domain::EntryPair& entries) = 0;

    /**
     * @throws domain::DuplicateIdempotencyKeyError при гонке ключей
     * @throws domain::ConflictError если фиксация не удалась
     */
    virtual void commit() = 0;

    virtual void rollback() = 0;
};

class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;
    virtual std::unique_ptr<IUnitOfWork> begin() = 0;
};

} // namespace ledger::ports::output
