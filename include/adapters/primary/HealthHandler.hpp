#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "settings/LedgerSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief GET /health: liveness и активное хранилище
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<settings::LedgerSettings> settings)
        : settings_(std::move(settings)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "ledger-service";
        response["version"] = "1.0.0";
        response["storage"] = settings_->getStorage();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<settings::LedgerSettings> settings_;
};

} // namespace ledger::adapters::primary
