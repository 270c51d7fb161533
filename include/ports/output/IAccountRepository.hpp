#pragma once

#include "domain/Account.hpp"
#include "domain/UserSummary.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Хранилище счетов (вне единицы работы)
 *
 * Блокировка счетов живёт в IUnitOfWork::lockAccounts: она держится
 * ровно столько, сколько транзакция БД.
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Найти счёт или создать с version = 0
     *
     * Безопасно при параллельных вызовах с одним ключом:
     * дубликат не создаётся (UNIQUE(user_id, asset_type_code) + upsert).
     */
    virtual domain::Account resolveOrCreate(
        const std::string& userId,
        const std::string& assetTypeCode,
        domain::AccountKind kind) = 0;

    virtual std::optional<domain::Account> findById(const std::string& accountId) = 0;
    virtual std::vector<domain::Account> findByUserId(const std::string& userId) = 0;

    /**
     * @brief Пользователи с USER-счетами, по возрастанию user_id
     */
    virtual std::vector<domain::UserSummary> listUsers() = 0;
};

} // namespace ledger::ports::output
