#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/LedgerJson.hpp"
#include "ports/input/IWalletService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief GET /api/v1/accounts?user_id= — счета пользователя
     */
    class GetAccountsHandler : public IHttpHandler
    {
    public:
        explicit GetAccountsHandler(std::shared_ptr<ports::input::IWalletService> walletService)
            : walletService_(std::move(walletService))
        {
            std::cout << "[GetAccountsHandler] Created" << std::endl;
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
                std::string userId = req.getQueryParam("user_id").value_or("");
                if (userId.empty())
                {
                    LedgerJson::sendError(res, 400, "user_id is required");
                    return;
                }

                nlohmann::json response;
                response["user_id"] = userId;
                response["accounts"] = nlohmann::json::array();
                for (const auto &account : walletService_->getAccounts(userId))
                {
                    response["accounts"].push_back(LedgerJson::toJson(account));
                }

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetAccountsHandler] Error: " << e.what() << std::endl;
                LedgerJson::sendError(res, 500, "Internal server error", "INTERNAL_ERROR");
            }
        }

    private:
        std::shared_ptr<ports::input::IWalletService> walletService_;
    };

} // namespace ledger::adapters::primary
