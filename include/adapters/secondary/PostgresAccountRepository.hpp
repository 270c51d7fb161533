// include/adapters/secondary/PostgresAccountRepository.hpp
#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "adapters/secondary/PostgresErrorTranslator.hpp"
#include "adapters/secondary/PostgresRowMapper.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища счетов
 *
 * resolveOrCreate: upsert по UNIQUE(user_id, asset_type_code):
 * параллельные вызовы с одним ключом дают один счёт.
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {}

    domain::Account resolveOrCreate(
        const std::string& userId,
        const std::string& assetTypeCode,
        domain::AccountKind kind) override
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            const auto accountId = domain::Account::makeId(userId, assetTypeCode);
            auto inserted = txn.exec_params(
                "INSERT INTO accounts (id, user_id, kind, asset_type_code, version) "
                "VALUES ($1, $2, $3, $4, 0) "
                "ON CONFLICT DO NOTHING",
                accountId,
                userId,
                domain::toString(kind),
                assetTypeCode
            );

            auto result = txn.exec_params(
                "SELECT " + PostgresRowMapper::accountColumns() +
                " FROM accounts WHERE user_id = $1 AND asset_type_code = $2",
                userId,
                assetTypeCode
            );
            if (result.empty()) {
                // Конфликт по первичному ключу с чужой парой (user_id, asset_type_code)
                throw domain::IntegrityError("Account id collision: " + accountId);
            }
            txn.commit();

            if (inserted.affected_rows() > 0) {
                std::cout << "[PostgresAccountRepository] Created account " << accountId
                          << " (" << domain::toString(kind) << ")" << std::endl;
            }
            return PostgresRowMapper::toAccount(result[0]);

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresAccountRepository", "resolveOrCreate");
        }
    }

    std::optional<domain::Account> findById(const std::string& accountId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + PostgresRowMapper::accountColumns() + " FROM accounts WHERE id = $1",
                accountId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return PostgresRowMapper::toAccount(result[0]);

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresAccountRepository", "findById");
        }
    }

    std::vector<domain::Account> findByUserId(const std::string& userId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + PostgresRowMapper::accountColumns() +
                " FROM accounts WHERE user_id = $1 ORDER BY asset_type_code",
                userId
            );

            std::vector<domain::Account> accounts;
            for (const auto& row : result) {
                accounts.push_back(PostgresRowMapper::toAccount(row));
            }
            return accounts;

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresAccountRepository", "findByUserId");
        }
    }

    std::vector<domain::UserSummary> listUsers() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT user_id, COUNT(*) AS account_count FROM accounts "
                "WHERE kind = 'USER' GROUP BY user_id ORDER BY user_id"
            );

            std::vector<domain::UserSummary> users;
            for (const auto& row : result) {
                users.push_back(domain::UserSummary{
                    row["user_id"].as<std::string>(),
                    row["account_count"].as<int64_t>()
                });
            }
            return users;

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresAccountRepository", "listUsers");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
