// include/adapters/secondary/InMemoryLedgerStore.hpp
#pragma once

#include "ports/output/IAssetTypeRepository.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory хранилище леджера (LEDGER_STORAGE=memory и unit-тесты)
 *
 * Один объект реализует все выходные порты, как одна БД.
 *
 * Блокировки:
 * - dataMutex_ (shared_mutex): данные, держится только на время чтения/применения
 * - rowLocks_: по одному timed_mutex на счёт, аналог SELECT ... FOR UPDATE,
 *   держатся единицей работы до commit/rollback
 *
 * Пока поток ждёт блокировку счёта, dataMutex_ он не держит.
 */
class InMemoryLedgerStore
    : public ports::output::IAssetTypeRepository
    , public ports::output::IAccountRepository
    , public ports::output::ILedgerRepository
    , public ports::output::ITransactionRepository
    , public ports::output::IUnitOfWorkFactory
{
public:
    explicit InMemoryLedgerStore(std::shared_ptr<settings::LedgerSettings> settings)
        : lockTimeout_(settings->getLockTimeout())
    {
        std::cout << "[InMemoryLedgerStore] Created (lock timeout "
                  << lockTimeout_.count() << "ms)" << std::endl;
    }

    // ============================================
    // IAssetTypeRepository
    // ============================================

    std::optional<domain::AssetType> findByCode(const std::string& code) override {
        std::shared_lock lock(dataMutex_);
        auto it = assetTypes_.find(code);
        if (it == assetTypes_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::AssetType> findAll() override {
        std::shared_lock lock(dataMutex_);
        std::vector<domain::AssetType> result;
        for (const auto& [code, assetType] : assetTypes_) {
            result.push_back(assetType);
        }
        return result;
    }

    void saveIfAbsent(const domain::AssetType& assetType) override {
        if (assetType.code.find(domain::Account::ID_SEPARATOR) != std::string::npos) {
            throw domain::ValidationError("Asset type code must not contain ':': " + assetType.code);
        }
        std::unique_lock lock(dataMutex_);
        assetTypes_.emplace(assetType.code, assetType);
    }

    // ============================================
    // IAccountRepository
    // ============================================

    domain::Account resolveOrCreate(
        const std::string& userId,
        const std::string& assetTypeCode,
        domain::AccountKind kind) override
    {
        std::unique_lock lock(dataMutex_);

        auto indexed = accountIndex_.find({userId, assetTypeCode});
        if (indexed != accountIndex_.end()) {
            return accounts_.at(indexed->second);
        }

        domain::Account account;
        account.id = domain::Account::makeId(userId, assetTypeCode);
        account.userId = userId;
        account.kind = kind;
        account.assetTypeCode = assetTypeCode;
        account.version = 0;
        account.createdAt = domain::Timestamp::now();

        // ID уже занят счётом с другой парой (user, asset): данные испорчены
        if (accounts_.count(account.id) > 0) {
            throw domain::IntegrityError("Account id collision: " + account.id);
        }

        accounts_.emplace(account.id, account);
        accountIndex_.emplace(std::make_pair(userId, assetTypeCode), account.id);
        std::cout << "[InMemoryLedgerStore] Created account " << account.id
                  << " (" << domain::toString(kind) << ")" << std::endl;
        return account;
    }

    std::optional<domain::Account> findById(const std::string& accountId) override {
        std::shared_lock lock(dataMutex_);
        auto it = accounts_.find(accountId);
        if (it == accounts_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::Account> findByUserId(const std::string& userId) override {
        std::shared_lock lock(dataMutex_);
        std::vector<domain::Account> result;
        for (auto it = accountIndex_.lower_bound({userId, ""});
             it != accountIndex_.end() && it->first.first == userId; ++it) {
            result.push_back(accounts_.at(it->second));
        }
        return result;
    }

    std::vector<domain::UserSummary> listUsers() override {
        std::shared_lock lock(dataMutex_);
        std::vector<domain::UserSummary> users;
        // accountIndex_ упорядочен по (user_id, asset): счета одного пользователя идут подряд
        for (const auto& [key, accountId] : accountIndex_) {
            if (accounts_.at(accountId).kind != domain::AccountKind::USER) {
                continue;
            }
            if (users.empty() || users.back().userId != key.first) {
                users.push_back(domain::UserSummary{key.first, 0});
            }
            ++users.back().accountCount;
        }
        return users;
    }

    // ============================================
    // ILedgerRepository
    // ============================================

    domain::Amount balanceOf(const std::string& accountId) override {
        std::shared_lock lock(dataMutex_);
        return balanceLocked(accountId);
    }

    std::vector<domain::Transaction> historyOf(
        const std::string& userId, int limit, int offset) override
    {
        std::shared_lock lock(dataMutex_);

        std::vector<const domain::Transaction*> own;
        for (const auto& [id, tx] : transactions_) {
            if (tx.userId == userId) {
                own.push_back(&tx);
            }
        }
        std::sort(own.begin(), own.end(),
            [](const domain::Transaction* a, const domain::Transaction* b) {
                if (a->createdAt != b->createdAt) return a->createdAt > b->createdAt;
                return a->id > b->id;
            });

        std::vector<domain::Transaction> page;
        for (size_t i = static_cast<size_t>(std::max(offset, 0));
             i < own.size() && page.size() < static_cast<size_t>(std::max(limit, 0)); ++i) {
            page.push_back(*own[i]);
        }
        return page;
    }

    std::vector<domain::LedgerEntry> entriesOf(const std::string& transactionId) override {
        std::shared_lock lock(dataMutex_);
        std::vector<domain::LedgerEntry> result;
        for (const auto& entry : entries_) {
            if (entry.transactionId == transactionId) {
                result.push_back(entry);
            }
        }
        return result;
    }

    domain::Amount totalOf(const std::string& assetTypeCode) override {
        std::shared_lock lock(dataMutex_);
        domain::Amount total;
        for (const auto& entry : entries_) {
            if (entry.assetTypeCode == assetTypeCode) {
                total += entry.signedAmount();
            }
        }
        return total;
    }

    // ============================================
    // ITransactionRepository
    // ============================================

    std::optional<domain::Transaction> findByIdempotencyKey(const std::string& key) override {
        std::shared_lock lock(dataMutex_);
        auto it = idempotencyIndex_.find(key);
        if (it == idempotencyIndex_.end()) return std::nullopt;
        return transactions_.at(it->second);
    }

    std::optional<domain::Transaction> findByTransactionId(const std::string& transactionId) override {
        std::shared_lock lock(dataMutex_);
        auto it = transactions_.find(transactionId);
        if (it == transactions_.end()) return std::nullopt;
        return it->second;
    }

    // ============================================
    // IUnitOfWorkFactory
    // ============================================

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        return std::make_unique<UnitOfWork>(*this);
    }

    // Test helpers
    size_t transactionCount() const {
        std::shared_lock lock(dataMutex_);
        return transactions_.size();
    }

    size_t entryCount() const {
        std::shared_lock lock(dataMutex_);
        return entries_.size();
    }

    size_t accountCount() const {
        std::shared_lock lock(dataMutex_);
        return accounts_.size();
    }

private:
    /**
     * @brief Единица работы поверх хранилища
     *
     * Записи буферизуются и применяются в commit() одним эксклюзивным
     * захватом dataMutex_: снаружи видно либо всё, либо ничего.
     */
    class UnitOfWork : public ports::output::IUnitOfWork {
    public:
        explicit UnitOfWork(InMemoryLedgerStore& store) : store_(store) {}

        ~UnitOfWork() override {
            if (!finished_) {
                rollback();
            }
        }

        std::vector<domain::Account> lockAccounts(const std::vector<std::string>& orderedAccountIds) override {
            std::vector<domain::Account> locked;
            for (const auto& accountId : orderedAccountIds) {
                auto mutex = store_.rowLock(accountId);
                std::unique_lock<std::timed_mutex> guard(*mutex, std::defer_lock);
                if (!guard.try_lock_for(store_.lockTimeout_)) {
                    releaseLocks();
                    std::cerr << "[InMemoryLedgerStore] Lock timeout on " << accountId << std::endl;
                    throw domain::LockTimeoutError("Lock wait timeout on account " + accountId);
                }
                held_.push_back(HeldLock{mutex, std::move(guard)});

                auto account = store_.findById(accountId);
                if (!account) {
                    releaseLocks();
                    throw domain::IntegrityError("Account not found under lock: " + accountId);
                }
                locked.push_back(*account);
            }
            return locked;
        }

        domain::Amount balanceOf(const std::string& accountId) override {
            auto balance = store_.balanceOf(accountId);
            for (const auto& pair : pending_) {
                for (const auto* entry : {&pair.debit, &pair.credit}) {
                    if (entry->accountId == accountId) {
                        balance += entry->signedAmount();
                    }
                }
            }
            return balance;
        }

        void insertTransaction(const domain::Transaction& transaction) override {
            if (transaction_) {
                throw domain::IntegrityError("Unit of work already holds transaction " + transaction_->id);
            }
            if (store_.findByIdempotencyKey(transaction.idempotencyKey)) {
                throw domain::DuplicateIdempotencyKeyError(transaction.idempotencyKey);
            }
            transaction_ = transaction;
        }

        void append(const domain::EntryPair& entries) override {
            pending_.push_back(entries);
        }

        void commit() override {
            if (finished_) {
                throw domain::IntegrityError("Unit of work already finished");
            }

            {
                std::unique_lock lock(store_.dataMutex_);

                // Проверки до первого изменения: commit атомарен
                if (transaction_) {
                    if (store_.idempotencyIndex_.count(transaction_->idempotencyKey) > 0) {
                        throw domain::DuplicateIdempotencyKeyError(transaction_->idempotencyKey);
                    }
                    if (store_.transactions_.count(transaction_->id) > 0) {
                        throw domain::IntegrityError("Duplicate transaction id: " + transaction_->id);
                    }
                }
                for (const auto& pair : pending_) {
                    for (const auto* entry : {&pair.debit, &pair.credit}) {
                        if (store_.accounts_.count(entry->accountId) == 0) {
                            throw domain::IntegrityError("Entry references unknown account: " + entry->accountId);
                        }
                    }
                }

                if (transaction_) {
                    store_.transactions_.emplace(transaction_->id, *transaction_);
                    store_.idempotencyIndex_.emplace(transaction_->idempotencyKey, transaction_->id);
                }
                for (const auto& pair : pending_) {
                    for (const auto* entry : {&pair.debit, &pair.credit}) {
                        store_.entriesByAccount_[entry->accountId].push_back(store_.entries_.size());
                        store_.entries_.push_back(*entry);
                        store_.accounts_.at(entry->accountId).version += 1;
                    }
                }
            }

            finished_ = true;
            transaction_.reset();
            pending_.clear();
            releaseLocks();
        }

        void rollback() override {
            finished_ = true;
            transaction_.reset();
            pending_.clear();
            releaseLocks();
        }

    private:
        struct HeldLock {
            std::shared_ptr<std::timed_mutex> mutex;
            std::unique_lock<std::timed_mutex> guard;
        };

        InMemoryLedgerStore& store_;
        std::vector<HeldLock> held_;
        std::optional<domain::Transaction> transaction_;
        std::vector<domain::EntryPair> pending_;
        bool finished_ = false;

        // В порядке, обратном захвату
        void releaseLocks() {
            while (!held_.empty()) {
                held_.pop_back();
            }
        }
    };

    std::chrono::milliseconds lockTimeout_;

    mutable std::shared_mutex dataMutex_;
    std::map<std::string, domain::AssetType> assetTypes_;
    std::unordered_map<std::string, domain::Account> accounts_;
    std::map<std::pair<std::string, std::string>, std::string> accountIndex_;   // (userId, asset) -> id
    std::unordered_map<std::string, domain::Transaction> transactions_;
    std::unordered_map<std::string, std::string> idempotencyIndex_;             // key -> transaction id
    std::vector<domain::LedgerEntry> entries_;
    std::unordered_map<std::string, std::vector<size_t>> entriesByAccount_;     // account id -> позиции в entries_

    std::mutex rowLocksMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> rowLocks_;

    std::shared_ptr<std::timed_mutex> rowLock(const std::string& accountId) {
        std::lock_guard<std::mutex> lock(rowLocksMutex_);
        auto& mutex = rowLocks_[accountId];
        if (!mutex) {
            mutex = std::make_shared<std::timed_mutex>();
        }
        return mutex;
    }

    domain::Amount balanceLocked(const std::string& accountId) const {
        domain::Amount balance;
        auto it = entriesByAccount_.find(accountId);
        if (it == entriesByAccount_.end()) return balance;
        for (size_t index : it->second) {
            balance += entries_[index].signedAmount();
        }
        return balance;
    }
};

} // namespace ledger::adapters::secondary
