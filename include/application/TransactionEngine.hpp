// include/application/TransactionEngine.hpp
#pragma once

#include "ports/input/ITransactionService.hpp"
#include "ports/output/IAssetTypeRepository.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/Errors.hpp"
#include "utils/IdGenerator.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace ledger::application {

/**
 * @brief Движок транзакций леджера
 *
 * Порядок обработки:
 * 1. Валидация (до любых блокировок)
 * 2. Поиск по ключу идемпотентности → повтор возвращает старую транзакцию
 * 3. Счета пользователя и казначейства (создаются по требованию;
 *    SPEND без счёта пользователя отклоняется сразу)
 * 4. Блокировка обоих счетов в лексикографическом порядке ID
 * 5. Повторная проверка ключа уже под блокировкой
 * 6. SPEND: проверка баланса под блокировкой
 * 7. Транзакция + пара проводок + commit одной единицей работы
 *
 * Направление:
 * - TOPUP, BONUS: debit = пользователь, credit = казначейство
 * - SPEND:        debit = казначейство, credit = пользователь
 *
 * Собственного изменяемого состояния нет, только настройки.
 */
class TransactionEngine : public ports::input::ITransactionService {
public:
    TransactionEngine(
        std::shared_ptr<ports::output::IAssetTypeRepository> assetTypes,
        std::shared_ptr<ports::output::IAccountRepository> accounts,
        std::shared_ptr<ports::output::ITransactionRepository> transactions,
        std::shared_ptr<ports::output::ILedgerRepository> journal,
        std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : assetTypes_(std::move(assetTypes))
      , accounts_(std::move(accounts))
      , transactions_(std::move(transactions))
      , journal_(std::move(journal))
      , unitOfWork_(std::move(unitOfWork))
      , settings_(std::move(settings))
    {
        std::cout << "[TransactionEngine] Created" << std::endl;
    }

    domain::Transaction process(const domain::TransactionRequest& request) override {
        validate(request);

        if (auto existing = transactions_->findByIdempotencyKey(request.idempotencyKey)) {
            std::cout << "[TransactionEngine] Idempotent replay: key=" << request.idempotencyKey
                      << " -> " << existing->id << std::endl;
            return *existing;
        }

        const bool spend = domain::withdrawsFromUser(request.type);

        // SPEND со счёта, которого нет, отклоняется без единой записи
        domain::Account userAccount;
        if (spend) {
            auto existing = accounts_->findById(
                domain::Account::makeId(request.userId, request.assetTypeCode));
            if (!existing) {
                std::cout << "[TransactionEngine] REJECTED: no " << request.assetTypeCode
                          << " account for " << request.userId << std::endl;
                throw domain::InsufficientBalanceError(
                    "Insufficient balance. Current: " + domain::Amount().toString() +
                    ", Required: " + request.amount.toString());
            }
            userAccount = *existing;
        } else {
            userAccount = accounts_->resolveOrCreate(
                request.userId, request.assetTypeCode, domain::AccountKind::USER);
        }
        auto treasuryAccount = accounts_->resolveOrCreate(
            settings_->getTreasuryUserId(), request.assetTypeCode, domain::AccountKind::SYSTEM);

        const std::string debitAccountId = spend ? treasuryAccount.id : userAccount.id;
        const std::string creditAccountId = spend ? userAccount.id : treasuryAccount.id;

        for (int attempt = 0;; ++attempt) {
            try {
                return write(request, userAccount.id, debitAccountId, creditAccountId);

            } catch (const domain::DuplicateIdempotencyKeyError&) {
                // Проиграли гонку за ключ: наша работа уже откачена
                return recoverDuplicate(request.idempotencyKey);

            } catch (const domain::ConflictError& e) {
                if (attempt >= settings_->getLockRetries()) {
                    std::cerr << "[TransactionEngine] Giving up after " << (attempt + 1)
                              << " attempt(s): " << e.what() << std::endl;
                    throw;
                }
                auto backoff = backoffFor(attempt);
                std::cerr << "[TransactionEngine] Retryable conflict (" << e.code() << "), attempt "
                          << (attempt + 1) << ", retry in " << backoff.count() << "ms" << std::endl;
                std::this_thread::sleep_for(backoff);

            } catch (const domain::IntegrityError& e) {
                std::cerr << "[TransactionEngine] Integrity error for key="
                          << request.idempotencyKey << ": " << e.what() << std::endl;
                throw;
            }
        }
    }

    std::optional<domain::Transaction> getTransaction(const std::string& transactionId) override {
        return transactions_->findByTransactionId(transactionId);
    }

    std::vector<domain::LedgerEntry> getEntries(const std::string& transactionId) override {
        return journal_->entriesOf(transactionId);
    }

    /**
     * @brief Канонический порядок блокировок
     *
     * Любые две транзакции по одной паре счетов запрашивают блокировки
     * в одном и том же порядке, поэтому циклического ожидания не бывает.
     */
    static std::vector<std::string> lockOrder(const std::string& first, const std::string& second) {
        std::vector<std::string> ids{first, second};
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        return ids;
    }

private:
    std::shared_ptr<ports::output::IAssetTypeRepository> assetTypes_;
    std::shared_ptr<ports::output::IAccountRepository> accounts_;
    std::shared_ptr<ports::output::ITransactionRepository> transactions_;
    std::shared_ptr<ports::output::ILedgerRepository> journal_;
    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWork_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    static constexpr size_t MAX_KEY_LENGTH = 255;
    static constexpr size_t MAX_USER_ID_LENGTH = 100;

    void validate(const domain::TransactionRequest& request) const {
        if (request.idempotencyKey.empty()) {
            throw domain::ValidationError("idempotency_key is required");
        }
        if (request.idempotencyKey.size() > MAX_KEY_LENGTH) {
            throw domain::ValidationError("idempotency_key must not exceed 255 characters");
        }
        if (request.userId.empty()) {
            throw domain::ValidationError("user_id is required");
        }
        if (request.userId.size() > MAX_USER_ID_LENGTH) {
            throw domain::ValidationError("user_id must not exceed 100 characters");
        }
        if (request.userId == settings_->getTreasuryUserId()) {
            throw domain::ValidationError("user_id " + request.userId + " is reserved for the system treasury");
        }

        switch (request.type) {
            case domain::TransactionType::TOPUP:
            case domain::TransactionType::BONUS:
            case domain::TransactionType::SPEND:
                break;
            default:
                throw domain::ValidationError(
                    "Transaction type " + domain::toString(request.type) + " is not supported");
        }

        if (!request.amount.isPositive()) {
            throw domain::ValidationError("Amount must be greater than 0");
        }
        if (request.amount < settings_->getMinAmount()) {
            throw domain::ValidationError("Amount must be at least " + settings_->getMinAmount().toString());
        }
        if (request.amount > settings_->getMaxAmount()) {
            throw domain::ValidationError("Amount must not exceed " + settings_->getMaxAmount().toString());
        }

        if (request.assetTypeCode.empty()) {
            throw domain::ValidationError("asset_type is required");
        }
        auto assetType = assetTypes_->findByCode(request.assetTypeCode);
        if (!assetType) {
            throw domain::ValidationError("Unknown asset type: " + request.assetTypeCode);
        }
        if (!assetType->active) {
            throw domain::ValidationError("Asset type " + request.assetTypeCode + " is inactive");
        }
    }

    domain::Transaction write(
        const domain::TransactionRequest& request,
        const std::string& userAccountId,
        const std::string& debitAccountId,
        const std::string& creditAccountId)
    {
        auto uow = unitOfWork_->begin();
        uow->lockAccounts(lockOrder(debitAccountId, creditAccountId));

        // Пока ждали блокировку, параллельный запрос с тем же ключом мог зафиксироваться
        if (auto winner = transactions_->findByIdempotencyKey(request.idempotencyKey)) {
            uow->rollback();
            std::cout << "[TransactionEngine] Key committed concurrently: " << request.idempotencyKey
                      << " -> " << winner->id << std::endl;
            return *winner;
        }

        if (domain::withdrawsFromUser(request.type)) {
            auto balance = uow->balanceOf(userAccountId);
            if (balance < request.amount) {
                uow->rollback();
                std::cout << "[TransactionEngine] REJECTED: insufficient balance on " << userAccountId
                          << " (" << balance.toString() << " < " << request.amount.toString() << ")" << std::endl;
                throw domain::InsufficientBalanceError(
                    "Insufficient balance. Current: " + balance.toString() +
                    ", Required: " + request.amount.toString());
            }
        }

        domain::Transaction transaction;
        transaction.id = utils::IdGenerator::transactionId();
        transaction.type = request.type;
        transaction.status = domain::TransactionStatus::COMPLETED;
        transaction.userId = request.userId;
        transaction.assetTypeCode = request.assetTypeCode;
        transaction.amount = request.amount;
        transaction.idempotencyKey = request.idempotencyKey;
        transaction.metadata = request.metadata;
        transaction.createdAt = domain::Timestamp::now();

        uow->insertTransaction(transaction);
        uow->append(domain::EntryPair::make(
            transaction.id,
            debitAccountId,
            creditAccountId,
            transaction.assetTypeCode,
            transaction.amount,
            utils::IdGenerator::entryId(),
            utils::IdGenerator::entryId(),
            transaction.createdAt));
        uow->commit();

        std::cout << "[TransactionEngine] Completed " << domain::toString(transaction.type) << " "
                  << transaction.id << ": " << transaction.amount.toString() << " "
                  << transaction.assetTypeCode << " " << debitAccountId << " <- " << creditAccountId
                  << std::endl;
        return transaction;
    }

    /// Экспоненциальная задержка: backoff * 2^attempt
    std::chrono::milliseconds backoffFor(int attempt) const {
        auto backoff = settings_->getRetryBackoff();
        for (int i = 0; i < attempt; ++i) {
            backoff *= 2;
        }
        return backoff;
    }

    domain::Transaction recoverDuplicate(const std::string& idempotencyKey) {
        auto winner = transactions_->findByIdempotencyKey(idempotencyKey);
        if (!winner) {
            std::cerr << "[TransactionEngine] Duplicate key without committed transaction: "
                      << idempotencyKey << std::endl;
            throw domain::IntegrityError("Idempotency key conflict without a committed transaction: " + idempotencyKey);
        }
        std::cout << "[TransactionEngine] Lost idempotency race: key=" << idempotencyKey
                  << " -> " << winner->id << std::endl;
        return *winner;
    }
};

} // namespace ledger::application
