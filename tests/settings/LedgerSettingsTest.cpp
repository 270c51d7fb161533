/**
 * @file LedgerSettingsTest.cpp
 * @brief Unit tests for LedgerSettings (ENV parsing and validation)
 */

#include <gtest/gtest.h>
#include "settings/LedgerSettings.hpp"

#include <chrono>
#include <cstdlib>
#include <stdexcept>

using namespace ledger;
using settings::LedgerSettings;

class LedgerSettingsTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("LEDGER_LOCK_RETRIES");
        unsetenv("LEDGER_RETRY_BACKOFF_MS");
    }
};

TEST_F(LedgerSettingsTest, Defaults) {
    LedgerSettings s;
    EXPECT_EQ(s.getStorage(), "postgres");
    EXPECT_EQ(s.getLockRetries(), 2);
    EXPECT_EQ(s.getRetryBackoff(), std::chrono::milliseconds(100));
    EXPECT_EQ(s.getTreasuryUserId(), "SYSTEM_TREASURY");
}

TEST_F(LedgerSettingsTest, LockRetries_FromEnv) {
    setenv("LEDGER_LOCK_RETRIES", "10", 1);
    setenv("LEDGER_RETRY_BACKOFF_MS", "0", 1);
    LedgerSettings s;
    EXPECT_EQ(s.getLockRetries(), LedgerSettings::MAX_LOCK_RETRIES);
    EXPECT_EQ(s.getRetryBackoff(), std::chrono::milliseconds(0));
}

TEST_F(LedgerSettingsTest, LockRetries_AboveCapRejected) {
    setenv("LEDGER_LOCK_RETRIES", "40", 1);
    EXPECT_THROW(LedgerSettings{}, std::invalid_argument);
}

TEST_F(LedgerSettingsTest, LockRetries_NegativeRejected) {
    setenv("LEDGER_LOCK_RETRIES", "-1", 1);
    EXPECT_THROW(LedgerSettings{}, std::invalid_argument);
}

TEST_F(LedgerSettingsTest, RetryBackoff_NegativeRejected) {
    setenv("LEDGER_RETRY_BACKOFF_MS", "-5", 1);
    EXPECT_THROW(LedgerSettings{}, std::invalid_argument);
}

TEST_F(LedgerSettingsTest, SetLockRetries_Validates) {
    LedgerSettings s;
    EXPECT_NO_THROW(s.setLockRetries(LedgerSettings::MAX_LOCK_RETRIES, std::chrono::milliseconds(1)));
    EXPECT_THROW(s.setLockRetries(LedgerSettings::MAX_LOCK_RETRIES + 1, std::chrono::milliseconds(1)),
                 std::invalid_argument);
    EXPECT_THROW(s.setLockRetries(1, std::chrono::milliseconds(-1)), std::invalid_argument);
}
