#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Тип транзакции
 *
 * TOPUP, BONUS: казначейство → пользователь
 * SPEND: пользователь → казначейство
 * REFUND, ADJUSTMENT зарезервированы и движком не обрабатываются.
 */
enum class TransactionType {
    TOPUP,
    BONUS,
    SPEND,
    REFUND,
    ADJUSTMENT
};

inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::TOPUP:      return "TOPUP";
        case TransactionType::BONUS:      return "BONUS";
        case TransactionType::SPEND:      return "SPEND";
        case TransactionType::REFUND:     return "REFUND";
        case TransactionType::ADJUSTMENT: return "ADJUSTMENT";
        default: return "UNKNOWN";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionType parseTransactionType(const std::string& str) {
    if (str == "TOPUP" || str == "topup")           return TransactionType::TOPUP;
    if (str == "BONUS" || str == "bonus")           return TransactionType::BONUS;
    if (str == "SPEND" || str == "spend")           return TransactionType::SPEND;
    if (str == "REFUND" || str == "refund")         return TransactionType::REFUND;
    if (str == "ADJUSTMENT" || str == "adjustment") return TransactionType::ADJUSTMENT;
    throw std::invalid_argument("Unknown transaction type: " + str);
}

/**
 * @brief Средства уходят с пользовательского счёта
 */
inline bool withdrawsFromUser(TransactionType type) {
    return type == TransactionType::SPEND;
}

} // namespace ledger::domain
