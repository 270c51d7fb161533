#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

enum class TransactionStatus {
    PENDING,
    COMPLETED,
    FAILED
};

inline std::string toString(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::PENDING:   return "PENDING";
        case TransactionStatus::COMPLETED: return "COMPLETED";
        case TransactionStatus::FAILED:    return "FAILED";
        default: return "UNKNOWN";
    }
}

inline TransactionStatus parseTransactionStatus(const std::string& str) {
    if (str == "PENDING")   return TransactionStatus::PENDING;
    if (str == "COMPLETED") return TransactionStatus::COMPLETED;
    if (str == "FAILED")    return TransactionStatus::FAILED;
    throw std::invalid_argument("Unknown transaction status: " + str);
}

} // namespace ledger::domain
