#pragma once

#include "ports/input/ITransactionService.hpp"
#include "ports/input/IWalletService.hpp"
#include "ports/output/IAssetTypeRepository.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>
#include <vector>

namespace ledger::application {

/**
 * @brief Начальное заполнение леджера при старте
 *
 * Идемпотентно, повторный запуск ничего не дублирует:
 * - типы активов: saveIfAbsent
 * - счета казначейства: resolveOrCreate
 * - демо-пользователи: TOPUP с фиксированными ключами идемпотентности
 *
 * В конце сверяет журнал: сумма балансов по каждому активу должна быть нулевой.
 */
class LedgerBootstrap {
public:
    LedgerBootstrap(
        std::shared_ptr<ports::output::IAssetTypeRepository> assetTypes,
        std::shared_ptr<ports::output::IAccountRepository> accounts,
        std::shared_ptr<ports::input::ITransactionService> transactions,
        std::shared_ptr<ports::input::IWalletService> wallet,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : assetTypes_(std::move(assetTypes))
      , accounts_(std::move(accounts))
      , transactions_(std::move(transactions))
      , wallet_(std::move(wallet))
      , settings_(std::move(settings))
    {}

    /**
     * @brief Выполнить заполнение
     * @return true, если журнал сбалансирован
     */
    bool run() {
        seedAssetTypes();
        createTreasuryAccounts();
        if (settings_->seedDemo()) {
            seedDemoUsers();
        }
        return reconcile();
    }

    static std::vector<domain::AssetType> defaultAssetTypes() {
        return {
            domain::AssetType("GOLD_COINS", "Gold Coins", "Primary in-game currency"),
            domain::AssetType("DIAMONDS", "Diamonds", "Premium currency"),
            domain::AssetType("LOYALTY_POINTS", "Loyalty Points", "Reward points for loyal users")
        };
    }

private:
    std::shared_ptr<ports::output::IAssetTypeRepository> assetTypes_;
    std::shared_ptr<ports::output::IAccountRepository> accounts_;
    std::shared_ptr<ports::input::ITransactionService> transactions_;
    std::shared_ptr<ports::input::IWalletService> wallet_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    struct DemoTopup {
        const char* userId;
        const char* assetTypeCode;
        const char* amount;
        const char* idempotencyKey;
    };

    void seedAssetTypes() {
        for (const auto& assetType : defaultAssetTypes()) {
            assetTypes_->saveIfAbsent(assetType);
        }
        std::cout << "[LedgerBootstrap] Asset types: " << assetTypes_->findAll().size() << std::endl;
    }

    void createTreasuryAccounts() {
        for (const auto& assetType : assetTypes_->findAll()) {
            if (!assetType.active) {
                continue;
            }
            auto account = accounts_->resolveOrCreate(
                settings_->getTreasuryUserId(), assetType.code, domain::AccountKind::SYSTEM);
            std::cout << "[LedgerBootstrap] Treasury account: " << account.id << std::endl;
        }
    }

    void seedDemoUsers() {
        static const DemoTopup demo[] = {
            {"user_001", "GOLD_COINS", "1000.00", "seed_user_001_GOLD_COINS"},
            {"user_001", "DIAMONDS", "100.00", "seed_user_001_DIAMONDS"},
            {"user_002", "GOLD_COINS", "500.00", "seed_user_002_GOLD_COINS"},
            {"user_002", "LOYALTY_POINTS", "50.00", "seed_user_002_LOYALTY_POINTS"},
        };

        for (const auto& topup : demo) {
            domain::TransactionRequest request;
            request.type = domain::TransactionType::TOPUP;
            request.userId = topup.userId;
            request.assetTypeCode = topup.assetTypeCode;
            request.amount = domain::Amount::parse(topup.amount);
            request.idempotencyKey = topup.idempotencyKey;
            request.metadata = {{"source", "seed"}};

            auto tx = transactions_->process(request);
            std::cout << "[LedgerBootstrap] Demo " << topup.userId << " " << topup.assetTypeCode
                      << " " << topup.amount << " -> " << tx.id << std::endl;
        }
    }

    bool reconcile() {
        bool balanced = true;
        for (const auto& [code, total] : wallet_->reconcile()) {
            if (total.isZero()) {
                std::cout << "[LedgerBootstrap] Reconcile " << code << ": 0.00" << std::endl;
            } else {
                balanced = false;
                std::cerr << "[LedgerBootstrap] Reconcile " << code
                          << ": journal imbalance " << total.toString() << std::endl;
            }
        }
        return balanced;
    }
};

} // namespace ledger::application
