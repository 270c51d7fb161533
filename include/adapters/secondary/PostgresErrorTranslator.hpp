// include/adapters/secondary/PostgresErrorTranslator.hpp
#pragma once

#include "domain/Errors.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief Перевод исключений libpqxx в доменные ошибки
 *
 * Вызывается только внутри catch-блока:
 * ```cpp
 * } catch (const std::exception&) {
 *     PostgresErrorTranslator::rethrow("PostgresUnitOfWork", "commit");
 * }
 * ```
 *
 * SQLSTATE:
 * - 55P03 lock_not_available, 57014 query_canceled → LockTimeoutError
 * - 40P01 deadlock_detected, 40001 serialization_failure → ConflictError
 * - 23505 на uq_transactions_idempotency_key → DuplicateIdempotencyKeyError
 * - прочие нарушения ограничений → IntegrityError
 */
class PostgresErrorTranslator {
public:
    static constexpr const char* IDEMPOTENCY_CONSTRAINT = "uq_transactions_idempotency_key";

    [[noreturn]] static void rethrow(const std::string& component,
                                     const std::string& operation,
                                     const std::string& idempotencyKey = "")
    {
        try {
            throw;
        } catch (const domain::LedgerException&) {
            throw;
        } catch (const pqxx::unique_violation& e) {
            if (std::string(e.what()).find(IDEMPOTENCY_CONSTRAINT) != std::string::npos) {
                throw domain::DuplicateIdempotencyKeyError(idempotencyKey);
            }
            log(component, operation, e.what());
            throw domain::IntegrityError("Unique constraint violated: " + std::string(e.what()));
        } catch (const pqxx::integrity_constraint_violation& e) {
            log(component, operation, e.what());
            throw domain::IntegrityError("Constraint violated: " + std::string(e.what()));
        } catch (const pqxx::sql_error& e) {
            const std::string state = e.sqlstate();
            log(component, operation, e.what());
            if (state == "55P03" || state == "57014") {
                throw domain::LockTimeoutError("Lock wait timeout: " + operation);
            }
            if (state == "40P01" || state == "40001") {
                throw domain::ConflictError("Concurrent update conflict: " + operation);
            }
            throw domain::IntegrityError("Database error in " + operation + ": " + std::string(e.what()));
        } catch (const pqxx::broken_connection& e) {
            log(component, operation, e.what());
            throw domain::ConflictError("Database connection lost: " + operation);
        } catch (const pqxx::in_doubt_error& e) {
            log(component, operation, e.what());
            throw domain::ConflictError("Commit outcome unknown: " + operation);
        } catch (const std::exception& e) {
            log(component, operation, e.what());
            throw domain::IntegrityError("Unexpected storage error in " + operation + ": " + std::string(e.what()));
        }
    }

private:
    static void log(const std::string& component, const std::string& operation, const char* what) {
        std::cerr << "[" << component << "] " << operation << " error: " << what << std::endl;
    }
};

} // namespace ledger::adapters::secondary
