// include/adapters/secondary/PostgresAssetTypeRepository.hpp
#pragma once

#include "ports/output/IAssetTypeRepository.hpp"
#include "adapters/secondary/PostgresErrorTranslator.hpp"
#include "adapters/secondary/PostgresRowMapper.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

class PostgresAssetTypeRepository : public ports::output::IAssetTypeRepository {
public:
    explicit PostgresAssetTypeRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {}

    std::optional<domain::AssetType> findByCode(const std::string& code) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT code, name, description, active FROM asset_types WHERE code = $1",
                code
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return PostgresRowMapper::toAssetType(result[0]);

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresAssetTypeRepository", "findByCode");
        }
    }

    std::vector<domain::AssetType> findAll() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT code, name, description, active FROM asset_types ORDER BY code");

            std::vector<domain::AssetType> assetTypes;
            for (const auto& row : result) {
                assetTypes.push_back(PostgresRowMapper::toAssetType(row));
            }
            return assetTypes;

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresAssetTypeRepository", "findAll");
        }
    }

    void saveIfAbsent(const domain::AssetType& assetType) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO asset_types (code, name, description, active) "
                "VALUES ($1, $2, $3, $4) "
                "ON CONFLICT (code) DO NOTHING",
                assetType.code,
                assetType.name,
                assetType.description,
                assetType.active
            );
            txn.commit();

            if (result.affected_rows() > 0) {
                std::cout << "[PostgresAssetTypeRepository] Seeded " << assetType.code << std::endl;
            }

        } catch (const std::exception&) {
            PostgresErrorTranslator::rethrow("PostgresAssetTypeRepository", "saveIfAbsent");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
