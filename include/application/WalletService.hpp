#pragma once

#include "ports/input/IWalletService.hpp"
#include "ports/output/IAssetTypeRepository.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Сервис чтения кошелька
 *
 * Обходит путь записи: блокировок не берёт, балансы считает по журналу.
 */
class WalletService : public ports::input::IWalletService {
public:
    WalletService(
        std::shared_ptr<ports::output::IAssetTypeRepository> assetTypes,
        std::shared_ptr<ports::output::IAccountRepository> accounts,
        std::shared_ptr<ports::output::ILedgerRepository> journal,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : assetTypes_(std::move(assetTypes))
      , accounts_(std::move(accounts))
      , journal_(std::move(journal))
      , settings_(std::move(settings))
    {
        std::cout << "[WalletService] Created" << std::endl;
    }

    /**
     * @brief Балансы всех счетов пользователя, по коду актива
     */
    std::vector<domain::Balance> getBalances(const std::string& userId) override {
        std::vector<domain::Balance> balances;
        for (const auto& account : getAccounts(userId)) {
            balances.push_back(domain::Balance{
                .assetTypeCode = account.assetTypeCode,
                .accountId = account.id,
                .amount = journal_->balanceOf(account.id)
            });
        }
        return balances;
    }

    std::vector<domain::Transaction> getHistory(
        const std::string& userId, int limit, int offset) override
    {
        if (limit < 1 || limit > settings_->getHistoryMaxLimit()) {
            throw domain::ValidationError(
                "limit must be between 1 and " + std::to_string(settings_->getHistoryMaxLimit()));
        }
        if (offset < 0) {
            throw domain::ValidationError("offset must be >= 0");
        }
        return journal_->historyOf(userId, limit, offset);
    }

    std::vector<domain::Account> getAccounts(const std::string& userId) override {
        auto accounts = accounts_->findByUserId(userId);
        std::sort(accounts.begin(), accounts.end(),
            [](const domain::Account& a, const domain::Account& b) {
                return a.assetTypeCode < b.assetTypeCode;
            });
        return accounts;
    }

    std::vector<domain::UserSummary> listUsers() override {
        return accounts_->listUsers();
    }

    std::map<std::string, domain::Amount> reconcile() override {
        std::map<std::string, domain::Amount> totals;
        for (const auto& assetType : assetTypes_->findAll()) {
            totals[assetType.code] = journal_->totalOf(assetType.code);
        }
        return totals;
    }

private:
    std::shared_ptr<ports::output::IAssetTypeRepository> assetTypes_;
    std::shared_ptr<ports::output::IAccountRepository> accounts_;
    std::shared_ptr<ports::output::ILedgerRepository> journal_;
    std::shared_ptr<settings::LedgerSettings> settings_;
};

} // namespace ledger::application
