#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/LedgerJson.hpp"
#include "ports/input/IWalletService.hpp"
#include "settings/LedgerSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief GET /api/v1/history?user_id=&limit=&offset= — транзакции пользователя
     *
     * Новые первыми. limit по умолчанию из LEDGER_HISTORY_DEFAULT_LIMIT,
     * диапазон проверяет WalletService.
     */
    class GetHistoryHandler : public IHttpHandler
    {
    public:
        GetHistoryHandler(
            std::shared_ptr<ports::input::IWalletService> walletService,
            std::shared_ptr<settings::LedgerSettings> settings)
            : walletService_(std::move(walletService)), settings_(std::move(settings))
        {
            std::cout << "[GetHistoryHandler] Created" << std::endl;
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

                auto limit = intParam(req, "limit", settings_->getHistoryDefaultLimit());
                auto offset = intParam(req, "offset", 0);
                if (!limit || !offset)
                {
                    LedgerJson::sendError(res, 400, "limit and offset must be integers");
                    return;
                }

                auto history = walletService_->getHistory(userId, *limit, *offset);

                nlohmann::json response;
                response["user_id"] = userId;
                response["limit"] = *limit;
                response["offset"] = *offset;
                response["transactions"] = nlohmann::json::array();
                for (const auto &tx : history)
                {
                    response["transactions"].push_back(LedgerJson::toJson(tx));
                }

                res.setResult(200, "application/json", response.dump());
            }
            catch (const domain::LedgerException &e)
            {
                LedgerJson::sendError(res, e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetHistoryHandler] Error: " << e.what() << std::endl;
                LedgerJson::sendError(res, 500, "Internal server error", "INTERNAL_ERROR");
            }
        }

    private:
        std::shared_ptr<ports::input::IWalletService> walletService_;
        std::shared_ptr<settings::LedgerSettings> settings_;

        static std::optional<int> intParam(IRequest &req, const std::string &name, int defaultValue)
        {
            auto raw = req.getQueryParam(name);
            if (!raw || raw->empty())
            {
                return defaultValue;
            }
            try
            {
                size_t pos = 0;
                int value = std::stoi(*raw, &pos);
                if (pos != raw->size())
                {
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::logic_error &)
            {
                return std::nullopt;
            }
        }
    };

} // namespace ledger::adapters::primary
