// include/adapters/secondary/PostgresTransactionRepository.hpp
#pragma once

#include "ports/output/ITransactionRepository.hpp"
#include "adapters/secondary/PostgresErrorTranslator.hpp"
#include "adapters/secondary/PostgresRowMapper.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief Индекс идемпотентности поверх таблицы transactions
 *
 * Уникальность обеспечивает ограничение uq_transactions_idempotency_key.
 */
class PostgresTransactionRepository : public ports::output::ITransactionRepository {
public:
    explicit PostgresTransactionRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {}

    std::optional<domain::Transaction> findByIdempotencyKey(const std::string& key) override {
        return findOne("idempotency_key", key, "findByIdempotencyKey");
    }

    std::optional<domain::Transaction> findByTransactionId(const std::string& transactionId) override {
        return findOne("id", transactionId, "findByTransactionId");
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    std::optional<domain::Transaction> findOne(
        const std::string& column, const std::string& value, const std::string& operation)
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + PostgresRowMapper::transactionColumns() +
                " FROM transactions WHERE " + column + " = $1",
                value
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return PostgresRowMapper::toTransaction(result[0]);

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresTransactionRepository", operation);
        }
    }
};

} // namespace ledger::adapters::secondary
