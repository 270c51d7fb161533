#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/LedgerJson.hpp"
#include "ports/input/ITransactionService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief GET /api/v1/transactions/{id} — транзакция с обеими проводками
     *
     * Роутер регистрирует с паттерном "/api/v1/transactions/*"
     */
    class GetTransactionHandler : public IHttpHandler
    {
    public:
        explicit GetTransactionHandler(std::shared_ptr<ports::input::ITransactionService> transactionService)
            : transactionService_(std::move(transactionService))
        {
            std::cout << "[GetTransactionHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                LedgerJson::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
                return;
            }

            try
            {
                std::string transactionId = req.getPathParam(0).value_or("");
                if (transactionId.empty())
                {
                    LedgerJson::sendError(res, 400, "Transaction ID is required");
                    return;
                }

                auto tx = transactionService_->getTransaction(transactionId);
                if (!tx)
                {
                    LedgerJson::sendError(res, 404, "Transaction not found", "NOT_FOUND");
                    return;
                }

                auto response = LedgerJson::toJson(*tx);
                response["entries"] = nlohmann::json::array();
                for (const auto &entry : transactionService_->getEntries(transactionId))
                {
                    response["entries"].push_back(LedgerJson::toJson(entry));
                }

                res.setResult(200, "application/json", response.dump());
            }
            catch (const domain::LedgerException &e)
            {
                LedgerJson::sendError(res, e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetTransactionHandler] Error: " << e.what() << std::endl;
                LedgerJson::sendError(res, 500, "Internal server error", "INTERNAL_ERROR");
            }
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;
    };

} // namespace ledger::adapters::primary
