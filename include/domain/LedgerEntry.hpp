#pragma once

#include "enums/EntrySide.hpp"
#include "Amount.hpp"
#include "Timestamp.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Проводка журнала (половина сбалансированной пары)
 *
 * accountId: счёт, на который ложится проводка,
 * counterpartyAccountId: второй счёт пары.
 * Запись неизменяема: исправление делается новой транзакцией.
 */
struct LedgerEntry {
    std::string id;                     ///< "led_xxxxxxxxxxxxxxxx"
    std::string transactionId;
    EntrySide side = EntrySide::DEBIT;
    std::string accountId;
    std::string counterpartyAccountId;
    std::string assetTypeCode;
    Amount amount;
    Timestamp createdAt;

    std::string debitAccountId() const {
        return side == EntrySide::DEBIT ? accountId : counterpartyAccountId;
    }

    std::string creditAccountId() const {
        return side == EntrySide::CREDIT ? accountId : counterpartyAccountId;
    }

    /**
     * @brief Вклад проводки в баланс accountId
     */
    Amount signedAmount() const {
        return side == EntrySide::DEBIT ? amount : -amount;
    }
};

/**
 * @brief Сбалансированная пара проводок одной транзакции
 *
 * Обе половины ссылаются на одну транзакцию, один актив и одну сумму,
 * счёт и контрагент в них переставлены. Поэтому сумма балансов
 * по всем счетам актива всегда равна нулю.
 */
struct EntryPair {
    LedgerEntry debit;
    LedgerEntry credit;

    static EntryPair make(const std::string& transactionId,
                          const std::string& debitAccountId,
                          const std::string& creditAccountId,
                          const std::string& assetTypeCode,
                          const Amount& amount,
                          const std::string& debitEntryId,
                          const std::string& creditEntryId,
                          const Timestamp& createdAt)
    {
        EntryPair pair;

        pair.debit.id = debitEntryId;
        pair.debit.transactionId = transactionId;
        pair.debit.side = EntrySide::DEBIT;
        pair.debit.accountId = debitAccountId;
        pair.debit.counterpartyAccountId = creditAccountId;
        pair.debit.assetTypeCode = assetTypeCode;
        pair.debit.amount = amount;
        pair.debit.createdAt = createdAt;

        pair.credit = pair.debit;
        pair.credit.id = creditEntryId;
        pair.credit.side = EntrySide::CREDIT;
        pair.credit.accountId = creditAccountId;
        pair.credit.counterpartyAccountId = debitAccountId;

        return pair;
    }
};

} // namespace ledger::domain
