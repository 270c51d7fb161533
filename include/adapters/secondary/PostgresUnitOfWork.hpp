// include/adapters/secondary/PostgresUnitOfWork.hpp
#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "adapters/secondary/PostgresErrorTranslator.hpp"
#include "adapters/secondary/PostgresLedgerRepository.hpp"
#include "adapters/secondary/PostgresRowMapper.hpp"
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Единица работы = одна транзакция PostgreSQL (READ COMMITTED)
 *
 * Своё соединение на каждую единицу работы. Блокировки строк счетов
 * (SELECT ... FOR UPDATE) держатся до commit/rollback.
 * lock_timeout и statement_timeout ограничивают ожидание; по истечении
 * транзакция откатывается целиком и наружу уходит LockTimeoutError.
 */
class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    PostgresUnitOfWork(const std::string& connectionString, std::chrono::milliseconds lockTimeout)
        : conn_(connectionString)
        , txn_(conn_)
    {
        const auto ms = std::to_string(lockTimeout.count());
        txn_.exec("SET LOCAL lock_timeout = '" + ms + "ms'");
        txn_.exec("SET LOCAL statement_timeout = '" + ms + "ms'");
    }

    std::vector<domain::Account> lockAccounts(const std::vector<std::string>& orderedAccountIds) override {
        std::vector<domain::Account> locked;
        try {
            for (const auto& accountId : orderedAccountIds) {
                auto result = txn_.exec_params(
                    "SELECT " + PostgresRowMapper::accountColumns() +
                    " FROM accounts WHERE id = $1 FOR UPDATE",
                    accountId
                );
                if (result.empty()) {
                    throw domain::IntegrityError("Account not found under lock: " + accountId);
                }
                locked.push_back(PostgresRowMapper::toAccount(result[0]));
            }
        } catch (const std::exception&) {
            finished_ = true;
            PostgresErrorTranslator::rethrow("PostgresUnitOfWork", "lockAccounts");
        }
        return locked;
    }

    domain::Amount balanceOf(const std::string& accountId) override {
        try {
            auto result = txn_.exec_params(PostgresLedgerRepository::balanceQuery(), accountId);
            return domain::Amount::parse(result[0][0].as<std::string>());
        } catch (const std::exception&) {
            finished_ = true;
            PostgresErrorTranslator::rethrow("PostgresUnitOfWork", "balanceOf");
        }
    }

    void insertTransaction(const domain::Transaction& transaction) override {
        try {
            txn_.exec_params(
                "INSERT INTO transactions "
                "(id, type, status, user_id, asset_type_code, amount, idempotency_key, metadata, created_at) "
                "VALUES ($1, $2, $3, $4, $5, $6::numeric, $7, $8, $9::timestamptz)",
                transaction.id,
                domain::toString(transaction.type),
                domain::toString(transaction.status),
                transaction.userId,
                transaction.assetTypeCode,
                transaction.amount.toString(),
                transaction.idempotencyKey,
                transaction.metadata.dump(),
                transaction.createdAt.toString()
            );
        } catch (const std::exception&) {
            finished_ = true;
            PostgresErrorTranslator::rethrow("PostgresUnitOfWork", "insertTransaction", transaction.idempotencyKey);
        }
    }

    void append(const domain::EntryPair& entries) override {
        try {
            for (const auto* entry : {&entries.debit, &entries.credit}) {
                txn_.exec_params(
                    "INSERT INTO ledger_entries "
                    "(id, transaction_id, side, account_id, counterparty_account_id, asset_type_code, amount, created_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7::numeric, $8::timestamptz)",
                    entry->id,
                    entry->transactionId,
                    domain::toString(entry->side),
                    entry->accountId,
                    entry->counterpartyAccountId,
                    entry->assetTypeCode,
                    entry->amount.toString(),
                    entry->createdAt.toString()
                );
            }
            txn_.exec_params(
                "UPDATE accounts SET version = version + 1 WHERE id IN ($1, $2)",
                entries.debit.accountId,
                entries.credit.accountId
            );
        } catch (const std::exception&) {
            finished_ = true;
            PostgresErrorTranslator::rethrow("PostgresUnitOfWork", "append");
        }
    }

    void commit() override {
        if (finished_) {
            throw domain::IntegrityError("Unit of work already finished");
        }
        finished_ = true;
        try {
            txn_.commit();
        } catch (const pqxx::sql_error&) {
            PostgresErrorTranslator::rethrow("PostgresUnitOfWork", "commit");
        } catch (const std::exception& e) {
            std::cerr << "[PostgresUnitOfWork] commit error: " << e.what() << std::endl;
            throw domain::ConflictError("Commit failed: " + std::string(e.what()));
        }
    }

    void rollback() override {
        if (finished_) {
            return;
        }
        finished_ = true;
        txn_.abort();
    }

private:
    pqxx::connection conn_;
    pqxx::work txn_;
    bool finished_ = false;
};

/**
 * @brief Фабрика единиц работы PostgreSQL
 */
class PostgresUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    PostgresUnitOfWorkFactory(
        std::shared_ptr<settings::DbSettings> dbSettings,
        std::shared_ptr<settings::LedgerSettings> ledgerSettings
    ) : dbSettings_(std::move(dbSettings))
      , ledgerSettings_(std::move(ledgerSettings))
    {}

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        try {
            return std::make_unique<PostgresUnitOfWork>(
                dbSettings_->getConnectionString(), ledgerSettings_->getLockTimeout());
        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresUnitOfWorkFactory", "begin");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::LedgerSettings> ledgerSettings_;
};

} // namespace ledger::adapters::secondary
