#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Базовое исключение леджера
 *
 * code: стабильный машинный код для клиента,
 * retryable: можно ли повторить запрос с тем же ключом идемпотентности.
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(const std::string& code, const std::string& message, bool retryable = false)
        : std::runtime_error(message)
        , code_(code)
        , retryable_(retryable)
    {}

    const std::string& code() const { return code_; }
    bool retryable() const { return retryable_; }

private:
    std::string code_;
    bool retryable_;
};

/**
 * @brief Неверный ввод: сумма, актив, ключ, пагинация
 *
 * Отклоняется до взятия блокировок, состояние не меняется.
 */
class ValidationError : public LedgerException {
public:
    explicit ValidationError(const std::string& message)
        : LedgerException("VALIDATION_ERROR", message) {}
};

/**
 * @brief Списание больше текущего баланса
 *
 * Обнаруживается под блокировкой, до записи.
 */
class InsufficientBalanceError : public LedgerException {
public:
    explicit InsufficientBalanceError(const std::string& message)
        : LedgerException("INSUFFICIENT_BALANCE", message) {}
};

/**
 * @brief Временный конфликт, запрос можно повторить
 */
class ConflictError : public LedgerException {
public:
    explicit ConflictError(const std::string& message, const std::string& code = "CONFLICT")
        : LedgerException(code, message, true) {}
};

class LockTimeoutError : public ConflictError {
public:
    explicit LockTimeoutError(const std::string& message)
        : ConflictError(message, "LOCK_TIMEOUT") {}
};

/**
 * @brief Ключ идемпотентности уже занят параллельной транзакцией
 *
 * Наружу не выходит: движок перечитывает и возвращает победителя.
 */
class DuplicateIdempotencyKeyError : public ConflictError {
public:
    explicit DuplicateIdempotencyKeyError(const std::string& key)
        : ConflictError("Duplicate idempotency key: " + key, "DUPLICATE_IDEMPOTENCY_KEY")
        , key_(key)
    {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

/**
 * @brief Неожиданное нарушение целостности, запрос откатывается целиком
 */
class IntegrityError : public LedgerException {
public:
    explicit IntegrityError(const std::string& message)
        : LedgerException("INTEGRITY_ERROR", message) {}
};

} // namespace ledger::domain
