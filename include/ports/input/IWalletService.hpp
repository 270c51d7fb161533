#pragma once

#include "domain/Account.hpp"
#include "domain/Balance.hpp"
#include "domain/Transaction.hpp"
#include "domain/UserSummary.hpp"
#include <map>
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Чтение кошелька: балансы, история, счета, пользователи
 */
class IWalletService {
public:
    virtual ~IWalletService() = default;

    virtual std::vector<domain::Balance> getBalances(const std::string& userId) = 0;

    /**
     * @throws domain::ValidationError при limit вне [1, max] или offset < 0
     */
    virtual std::vector<domain::Transaction> getHistory(
        const std::string& userId, int limit, int offset) = 0;

    virtual std::vector<domain::Account> getAccounts(const std::string& userId) = 0;

    virtual std::vector<domain::UserSummary> listUsers() = 0;

    /**
     * @brief Сумма балансов по каждому активу (должна быть нулевой)
     */
    virtual std::map<std::string, domain::Amount> reconcile() = 0;
};

} // namespace ledger::ports::input
