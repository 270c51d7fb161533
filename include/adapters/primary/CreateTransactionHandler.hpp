#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/LedgerJson.hpp"
#include "ports/input/ITransactionService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief POST /api/v1/transactions — провести транзакцию
     *
     * Тот же обработчик обслуживает /topup, /bonus, /spend: для них тип
     * задан при создании, поле "type" в теле игнорируется.
     *
     * Тело:
     * {
     *   "user_id": "user_001",
     *   "asset_type": "GOLD_COINS",        // или asset_type_code
     *   "amount": "100.00",
     *   "idempotency_key": "k1",           // или заголовок X-Idempotency-Key
     *   "metadata": {...}                  // опционально
     * }
     */
    class CreateTransactionHandler : public IHttpHandler
    {
    public:
        explicit CreateTransactionHandler(
            std::shared_ptr<ports::input::ITransactionService> transactionService,
            std::optional<domain::TransactionType> fixedType = std::nullopt)
            : transactionService_(std::move(transactionService)), fixedType_(fixedType)
        {
            std::cout << "[CreateTransactionHandler] Created"
                      << (fixedType_ ? " for " + domain::toString(*fixedType_) : std::string())
                      << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                LedgerJson::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
                return;
            }

            nlohmann::json body;
            try
            {
                body = nlohmann::json::parse(req.getBody());
            }
            catch (const nlohmann::json::exception &)
            {
                LedgerJson::sendError(res, 400, "Invalid JSON");
                return;
            }
            if (!body.is_object())
            {
                LedgerJson::sendError(res, 400, "Request body must be a JSON object");
                return;
            }

            try
            {
                domain::TransactionRequest request;

                if (fixedType_)
                {
                    request.type = *fixedType_;
                }
                else
                {
                    auto type = stringField(body, "type");
                    if (type.empty())
                    {
                        LedgerJson::sendError(res, 400, "type is required");
                        return;
                    }
                    request.type = domain::parseTransactionType(type);
                }

                request.userId = stringField(body, "user_id");
                request.assetTypeCode = stringField(body, "asset_type");
                if (request.assetTypeCode.empty())
                {
                    request.assetTypeCode = stringField(body, "asset_type_code");
                }

                if (!body.contains("amount"))
                {
                    LedgerJson::sendError(res, 400, "amount is required");
                    return;
                }
                const auto &amount = body["amount"];
                if (amount.is_string())
                {
                    request.amount = domain::Amount::parse(amount.get<std::string>());
                }
                else if (amount.is_number())
                {
                    // Кратчайшая десятичная запись числа, разбор без double
                    request.amount = domain::Amount::parse(amount.dump());
                }
                else
                {
                    LedgerJson::sendError(res, 400, "amount must be a decimal string");
                    return;
                }

                request.idempotencyKey = stringField(body, "idempotency_key");
                if (request.idempotencyKey.empty())
                {
                    request.idempotencyKey = req.getHeader("X-Idempotency-Key").value_or("");
                }

                if (body.contains("metadata"))
                {
                    request.metadata = body["metadata"];
                }

                auto tx = transactionService_->process(request);
                res.setResult(201, "application/json", LedgerJson::toJson(tx).dump());
            }
            catch (const domain::LedgerException &e)
            {
                LedgerJson::sendError(res, e);
            }
            catch (const std::invalid_argument &e)
            {
                LedgerJson::sendError(res, 400, e.what());
            }
            catch (const nlohmann::json::exception &e)
            {
                LedgerJson::sendError(res, 400, std::string("Invalid field: ") + e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CreateTransactionHandler] Error: " << e.what() << std::endl;
                LedgerJson::sendError(res, 500, "Internal server error", "INTERNAL_ERROR");
            }
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;
        std::optional<domain::TransactionType> fixedType_;

        static std::string stringField(const nlohmann::json &body, const char *name)
        {
            if (!body.contains(name) || body[name].is_null())
            {
                return "";
            }
            return body[name].get<std::string>();
        }
    };

} // namespace ledger::adapters::primary
