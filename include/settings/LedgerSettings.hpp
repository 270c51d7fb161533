#pragma once

#include "domain/Amount.hpp"
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки движка леджера
 *
 * Читает из ENV:
 * - LEDGER_STORAGE (default: postgres; memory: in-memory хранилище)
 * - LEDGER_MIN_AMOUNT (default: 0.01)
 * - LEDGER_MAX_AMOUNT (default: 1000000.00)
 * - LEDGER_LOCK_TIMEOUT_MS (default: 5000)
 * - LEDGER_LOCK_RETRIES (default: 2)
 * - LEDGER_RETRY_BACKOFF_MS (default: 100)
 * - LEDGER_TREASURY_USER_ID (default: SYSTEM_TREASURY)
 * - LEDGER_HISTORY_DEFAULT_LIMIT (default: 50)
 * - LEDGER_HISTORY_MAX_LIMIT (default: 100)
 * - LEDGER_SEED_DEMO (default: false)
 *
 * Сеттеры нужны тестам и не вызываются из приложения.
 */
class LedgerSettings {
public:
    LedgerSettings() {
        if (const char* val = std::getenv("LEDGER_STORAGE")) {
            storage_ = val;
            if (storage_ != "postgres" && storage_ != "memory") {
                throw std::invalid_argument("LEDGER_STORAGE must be 'postgres' or 'memory', got: " + storage_);
            }
        }
        if (const char* val = std::getenv("LEDGER_MIN_AMOUNT")) {
            minAmount_ = domain::Amount::parse(val);
        }
        if (const char* val = std::getenv("LEDGER_MAX_AMOUNT")) {
            maxAmount_ = domain::Amount::parse(val);
        }
        if (const char* val = std::getenv("LEDGER_LOCK_TIMEOUT_MS")) {
            lockTimeout_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("LEDGER_LOCK_RETRIES")) {
            lockRetries_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_RETRY_BACKOFF_MS")) {
            retryBackoff_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("LEDGER_TREASURY_USER_ID")) {
            treasuryUserId_ = val;
        }
        if (const char* val = std::getenv("LEDGER_HISTORY_DEFAULT_LIMIT")) {
            historyDefaultLimit_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_HISTORY_MAX_LIMIT")) {
            historyMaxLimit_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_SEED_DEMO")) {
            std::string s = val;
            seedDemo_ = (s == "true" || s == "1" || s == "yes");
        }
        validate();
    }

    std::string getStorage() const { return storage_; }
    bool useInMemoryStorage() const { return storage_ == "memory"; }
    domain::Amount getMinAmount() const { return minAmount_; }
    domain::Amount getMaxAmount() const { return maxAmount_; }
    std::chrono::milliseconds getLockTimeout() const { return lockTimeout_; }
    int getLockRetries() const { return lockRetries_; }
    std::chrono::milliseconds getRetryBackoff() const { return retryBackoff_; }
    std::string getTreasuryUserId() const { return treasuryUserId_; }
    int getHistoryDefaultLimit() const { return historyDefaultLimit_; }
    int getHistoryMaxLimit() const { return historyMaxLimit_; }
    bool seedDemo() const { return seedDemo_; }

    void setStorage(const std::string& storage) { storage_ = storage; }
    void setAmountBounds(domain::Amount min, domain::Amount max) {
        minAmount_ = min;
        maxAmount_ = max;
        validate();
    }
    void setLockTimeout(std::chrono::milliseconds timeout) { lockTimeout_ = timeout; }
    void setLockRetries(int retries, std::chrono::milliseconds backoff) {
        lockRetries_ = retries;
        retryBackoff_ = backoff;
        validate();
    }
    void setTreasuryUserId(const std::string& userId) { treasuryUserId_ = userId; }
    void setSeedDemo(bool seed) { seedDemo_ = seed; }

    /// Верхняя граница повторов: задержка удваивается на каждой попытке
    static constexpr int MAX_LOCK_RETRIES = 10;

private:
    std::string storage_ = "postgres";
    domain::Amount minAmount_ = domain::Amount::fromMinorUnits(1);
    domain::Amount maxAmount_ = domain::Amount::fromMinorUnits(100000000);
    std::chrono::milliseconds lockTimeout_{5000};
    int lockRetries_ = 2;
    std::chrono::milliseconds retryBackoff_{100};
    std::string treasuryUserId_ = "SYSTEM_TREASURY";
    int historyDefaultLimit_ = 50;
    int historyMaxLimit_ = 100;
    bool seedDemo_ = false;

    void validate() const {
        if (!minAmount_.isPositive()) {
            throw std::invalid_argument("LEDGER_MIN_AMOUNT must be positive");
        }
        if (maxAmount_ < minAmount_) {
            throw std::invalid_argument("LEDGER_MAX_AMOUNT must be >= LEDGER_MIN_AMOUNT");
        }
        if (lockTimeout_.count() <= 0) {
            throw std::invalid_argument("LEDGER_LOCK_TIMEOUT_MS must be positive");
        }
        if (lockRetries_ < 0 || lockRetries_ > MAX_LOCK_RETRIES) {
            throw std::invalid_argument(
                "LEDGER_LOCK_RETRIES must be in [0, " + std::to_string(MAX_LOCK_RETRIES) + "]");
        }
        if (retryBackoff_.count() < 0) {
            throw std::invalid_argument("LEDGER_RETRY_BACKOFF_MS must be >= 0");
        }
        if (treasuryUserId_.empty()) {
            throw std::invalid_argument("LEDGER_TREASURY_USER_ID must not be empty");
        }
        if (historyMaxLimit_ < 1 || historyDefaultLimit_ < 1 || historyDefaultLimit_ > historyMaxLimit_) {
            throw std::invalid_argument("LEDGER_HISTORY_DEFAULT_LIMIT must be in [1, LEDGER_HISTORY_MAX_LIMIT]");
        }
    }
};

} // namespace ledger::settings
