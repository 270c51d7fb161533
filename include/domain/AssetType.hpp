#pragma once

#include <string>
#include <utility>

namespace ledger::domain {

/**
 * @brief Тип актива (внутренняя валюта)
 *
 * Справочник заполняется один раз при старте,
 * дальше меняется только флаг active.
 */
struct AssetType {
    std::string code;           ///< Уникальный код ("GOLD_COINS")
    std::string name;           ///< Отображаемое имя ("Gold Coins")
    std::string description;
    bool active = true;

    AssetType() = default;

    AssetType(std::string code, std::string name, std::string description = "", bool active = true)
        : code(std::move(code))
        , name(std::move(name))
        , description(std::move(description))
        , active(active)
    {}
};

} // namespace ledger::domain
