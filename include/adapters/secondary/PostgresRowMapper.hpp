// include/adapters/secondary/PostgresRowMapper.hpp
#pragma once

#include "domain/Account.hpp"
#include "domain/AssetType.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Transaction.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief Маппинг строк PostgreSQL в доменные структуры
 *
 * NUMERIC(20,2) читается как текст (amount::text), чтобы сумма
 * не проходила через double. created_at читается в UTC с микросекундами.
 */
class PostgresRowMapper {
public:
    static std::string createdAtColumn() {
        return "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"') AS created_at";
    }

    static std::string accountColumns() {
        return "id, user_id, kind, asset_type_code, version, " + createdAtColumn();
    }

    static std::string transactionColumns() {
        return "id, type, status, user_id, asset_type_code, amount::text AS amount, "
               "idempotency_key, metadata, " + createdAtColumn();
    }

    static std::string entryColumns() {
        return "id, transaction_id, side, account_id, counterparty_account_id, "
               "asset_type_code, amount::text AS amount, " + createdAtColumn();
    }

    static domain::AssetType toAssetType(const pqxx::row& row) {
        return domain::AssetType(
            row["code"].as<std::string>(),
            row["name"].as<std::string>(),
            row["description"].as<std::string>(),
            row["active"].as<bool>());
    }

    static domain::Account toAccount(const pqxx::row& row) {
        domain::Account account;
        account.id = row["id"].as<std::string>();
        account.userId = row["user_id"].as<std::string>();
        account.kind = domain::parseAccountKind(row["kind"].as<std::string>());
        account.assetTypeCode = row["asset_type_code"].as<std::string>();
        account.version = row["version"].as<int64_t>();
        account.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
        return account;
    }

    static domain::Transaction toTransaction(const pqxx::row& row) {
        domain::Transaction tx;
        tx.id = row["id"].as<std::string>();
        tx.type = domain::parseTransactionType(row["type"].as<std::string>());
        tx.status = domain::parseTransactionStatus(row["status"].as<std::string>());
        tx.userId = row["user_id"].as<std::string>();
        tx.assetTypeCode = row["asset_type_code"].as<std::string>();
        tx.amount = domain::Amount::parse(row["amount"].as<std::string>());
        tx.idempotencyKey = row["idempotency_key"].as<std::string>();
        if (!row["metadata"].is_null()) {
            tx.metadata = nlohmann::json::parse(row["metadata"].as<std::string>());
        }
        tx.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
        return tx;
    }

    static domain::LedgerEntry toEntry(const pqxx::row& row) {
        domain::LedgerEntry entry;
        entry.id = row["id"].as<std::string>();
        entry.transactionId = row["transaction_id"].as<std::string>();
        entry.side = domain::parseEntrySide(row["side"].as<std::string>());
        entry.accountId = row["account_id"].as<std::string>();
        entry.counterpartyAccountId = row["counterparty_account_id"].as<std::string>();
        entry.assetTypeCode = row["asset_type_code"].as<std::string>();
        entry.amount = domain::Amount::parse(row["amount"].as<std::string>());
        entry.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
        return entry;
    }
};

} // namespace ledger::adapters::secondary
