// include/adapters/secondary/PostgresSchema.hpp
#pragma once

#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Схема леджера в PostgreSQL
 *
 * Таблицы:
 * - asset_types     справочник активов
 * - accounts        UNIQUE(user_id, asset_type_code), баланса нет
 * - transactions    UNIQUE(idempotency_key), amount NUMERIC(20,2)
 * - ledger_entries  append-only, индекс (account_id, side) для агрегата баланса
 *
 * Все CREATE идемпотентны, повторный запуск безопасен.
 */
class PostgresSchema {
public:
    explicit PostgresSchema(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {}

    void init() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS asset_types (
                    code VARCHAR(50) PRIMARY KEY CHECK (code ~ '^[A-Z0-9_]+$'),
                    name VARCHAR(100) NOT NULL,
                    description TEXT NOT NULL DEFAULT '',
                    active BOOLEAN NOT NULL DEFAULT TRUE,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS accounts (
                    id VARCHAR(160) PRIMARY KEY,
                    user_id VARCHAR(100) NOT NULL,
                    kind VARCHAR(10) NOT NULL CHECK (kind IN ('USER', 'SYSTEM')),
                    asset_type_code VARCHAR(50) NOT NULL REFERENCES asset_types(code),
                    version BIGINT NOT NULL DEFAULT 0,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    CONSTRAINT uq_accounts_user_asset UNIQUE (user_id, asset_type_code)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS transactions (
                    id VARCHAR(32) PRIMARY KEY,
                    type VARCHAR(20) NOT NULL,
                    status VARCHAR(20) NOT NULL,
                    user_id VARCHAR(100) NOT NULL,
                    asset_type_code VARCHAR(50) NOT NULL REFERENCES asset_types(code),
                    amount NUMERIC(20, 2) NOT NULL CHECK (amount > 0),
                    idempotency_key VARCHAR(255) NOT NULL,
                    metadata TEXT,
                    created_at TIMESTAMPTZ NOT NULL,
                    CONSTRAINT uq_transactions_idempotency_key UNIQUE (idempotency_key)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_entries (
                    id VARCHAR(32) PRIMARY KEY,
                    transaction_id VARCHAR(32) NOT NULL REFERENCES transactions(id),
                    side VARCHAR(6) NOT NULL CHECK (side IN ('DEBIT', 'CREDIT')),
                    account_id VARCHAR(160) NOT NULL REFERENCES accounts(id),
                    counterparty_account_id VARCHAR(160) NOT NULL REFERENCES accounts(id),
                    asset_type_code VARCHAR(50) NOT NULL REFERENCES asset_types(code),
                    amount NUMERIC(20, 2) NOT NULL CHECK (amount > 0),
                    created_at TIMESTAMPTZ NOT NULL
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_entries_account_side "
                     "ON ledger_entries (account_id, side)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_entries_transaction "
                     "ON ledger_entries (transaction_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_transactions_user_created "
                     "ON transactions (user_id, created_at DESC, id DESC)");

            txn.commit();
            std::cout << "[PostgresSchema] Schema initialized in " << settings_->getName() << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSchema] init error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
