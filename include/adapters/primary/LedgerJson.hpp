#pragma once

#include <IResponse.hpp>
#include "domain/Account.hpp"
#include "domain/Balance.hpp"
#include "domain/Errors.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Transaction.hpp"
#include "domain/UserSummary.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

namespace ledger::adapters::primary
{

    /**
     * @brief JSON-представление леджера для HTTP-ответов
     *
     * Суммы отдаются строкой ("100.00"), чтобы клиент не терял копейки на double.
     */
    class LedgerJson
    {
    public:
        static nlohmann::json toJson(const domain::Transaction &tx)
        {
            nlohmann::json j;
            j["transaction_id"] = tx.id;
            j["type"] = domain::toString(tx.type);
            j["status"] = domain::toString(tx.status);
            j["user_id"] = tx.userId;
            j["asset_type"] = tx.assetTypeCode;
            j["amount"] = tx.amount.toString();
            j["idempotency_key"] = tx.idempotencyKey;
            j["metadata"] = tx.metadata;
            j["created_at"] = tx.createdAt.toString();
            return j;
        }

        static nlohmann::json toJson(const domain::LedgerEntry &entry)
        {
            nlohmann::json j;
            j["entry_id"] = entry.id;
            j["transaction_id"] = entry.transactionId;
            j["side"] = domain::toString(entry.side);
            j["account_id"] = entry.accountId;
            j["counterparty_account_id"] = entry.counterpartyAccountId;
            j["debit_account_id"] = entry.debitAccountId();
            j["credit_account_id"] = entry.creditAccountId();
            j["asset_type"] = entry.assetTypeCode;
            j["amount"] = entry.amount.toString();
            j["created_at"] = entry.createdAt.toString();
            return j;
        }

        static nlohmann::json toJson(const domain::Account &account)
        {
            nlohmann::json j;
            j["account_id"] = account.id;
            j["user_id"] = account.userId;
            j["kind"] = domain::toString(account.kind);
            j["asset_type"] = account.assetTypeCode;
            j["version"] = account.version;
            j["created_at"] = account.createdAt.toString();
            return j;
        }

        static nlohmann::json toJson(const domain::Balance &balance)
        {
            nlohmann::json j;
            j["asset_type"] = balance.assetTypeCode;
            j["account_id"] = balance.accountId;
            j["balance"] = balance.amount.toString();
            return j;
        }

        static nlohmann::json toJson(const domain::UserSummary &user)
        {
            nlohmann::json j;
            j["user_id"] = user.userId;
            j["account_count"] = user.accountCount;
            return j;
        }

        static void sendError(IResponse &res, int status, const std::string &message,
                              const std::string &code = "VALIDATION_ERROR", bool retryable = false)
        {
            nlohmann::json error;
            error["error"] = message;
            error["code"] = code;
            error["retryable"] = retryable;
            res.setResult(status, "application/json", error.dump());
        }

        /**
         * @brief Ошибка леджера → HTTP
         *
         * VALIDATION_ERROR 400, INSUFFICIENT_BALANCE 422,
         * CONFLICT/LOCK_TIMEOUT 503 (можно повторить), прочее 500
         */
        static void sendError(IResponse &res, const domain::LedgerException &e)
        {
            sendError(res, statusFor(e), e.what(), e.code(), e.retryable());
        }

        static int statusFor(const domain::LedgerException &e)
        {
            if (dynamic_cast<const domain::ValidationError *>(&e))
                return 400;
            if (dynamic_cast<const domain::InsufficientBalanceError *>(&e))
                return 422;
            if (dynamic_cast<const domain::ConflictError *>(&e))
                return 503;
            return 500;
        }
    };

} // namespace ledger::adapters::primary
