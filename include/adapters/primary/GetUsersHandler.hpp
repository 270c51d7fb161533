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
     * @brief GET /api/v1/users — пользователи и число их счетов
     *
     * Счета казначейства в список не попадают.
     */
    class GetUsersHandler : public IHttpHandler
    {
    public:
        explicit GetUsersHandler(std::shared_ptr<ports::input::IWalletService> walletService)
            : walletService_(std::move(walletService))
        {
            std::cout << "[GetUsersHandler] Created" << std::endl;
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
                nlohmann::json response;
                response["users"] = nlohmann::json::array();
                for (const auto &user : walletService_->listUsers())
                {
                    response["users"].push_back(LedgerJson::toJson(user));
                }

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetUsersHandler] Error: " << e.what() << std::endl;
                LedgerJson::sendError(res, 500, "Internal server error", "INTERNAL_ERROR");
            }
        }

    private:
        std::shared_ptr<ports::input::IWalletService> walletService_;
    };

} // namespace ledger::adapters::primary
