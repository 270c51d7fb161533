// include/adapters/secondary/PostgresLedgerRepository.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "adapters/secondary/PostgresErrorTranslator.hpp"
#include "adapters/secondary/PostgresRowMapper.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief Чтение журнала проводок из PostgreSQL
 *
 * Баланс: агрегат по индексу (account_id, side), не хранится нигде.
 */
class PostgresLedgerRepository : public ports::output::ILedgerRepository {
public:
    explicit PostgresLedgerRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {}

    /**
     * @brief SQL агрегата баланса, общий с PostgresUnitOfWork
     */
    static std::string balanceQuery() {
        return "SELECT COALESCE(SUM(CASE WHEN side = 'DEBIT' THEN amount ELSE -amount END), 0)"
               "::numeric(20, 2)::text FROM ledger_entries WHERE account_id = $1";
    }

    domain::Amount balanceOf(const std::string& accountId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(balanceQuery(), accountId);
            return domain::Amount::parse(result[0][0].as<std::string>());

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresLedgerRepository", "balanceOf");
        }
    }

    std::vector<domain::Transaction> historyOf(
        const std::string& userId, int limit, int offset) override
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + PostgresRowMapper::transactionColumns() +
                " FROM transactions WHERE user_id = $1 "
                "ORDER BY created_at DESC, id DESC "
                "LIMIT $2 OFFSET $3",
                userId,
                limit,
                offset
            );

            std::vector<domain::Transaction> history;
            for (const auto& row : result) {
                history.push_back(PostgresRowMapper::toTransaction(row));
            }
            return history;

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresLedgerRepository", "historyOf");
        }
    }

    std::vector<domain::LedgerEntry> entriesOf(const std::string& transactionId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            // 'DEBIT' > 'CREDIT': дебетовая половина первой
            auto result = txn.exec_params(
                "SELECT " + PostgresRowMapper::entryColumns() +
                " FROM ledger_entries WHERE transaction_id = $1 ORDER BY side DESC",
                transactionId
            );

            std::vector<domain::LedgerEntry> entries;
            for (const auto& row : result) {
                entries.push_back(PostgresRowMapper::toEntry(row));
            }
            return entries;

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresLedgerRepository", "entriesOf");
        }
    }

    domain::Amount totalOf(const std::string& assetTypeCode) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT COALESCE(SUM(CASE WHEN side = 'DEBIT' THEN amount ELSE -amount END), 0)"
                "::numeric(20, 2)::text FROM ledger_entries WHERE asset_type_code = $1",
                assetTypeCode
            );
            return domain::Amount::parse(result[0][0].as<std::string>());

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresLedgerRepository", "totalOf");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
