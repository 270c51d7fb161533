#pragma once

#include "domain/AssetType.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Справочник типов активов
 */
class IAssetTypeRepository {
public:
    virtual ~IAssetTypeRepository() = default;

    virtual std::optional<domain::AssetType> findByCode(const std::string& code) = 0;
    virtual std::vector<domain::AssetType> findAll() = 0;

    /**
     * @brief Добавить тип актива, если его ещё нет (seed)
     */
    virtual void saveIfAbsent(const domain::AssetType& assetType) = 0;
};

} // namespace ledger::ports::output
