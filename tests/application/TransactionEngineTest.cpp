/**
 * @file TransactionEngineTest.cpp
 * @brief Unit tests for TransactionEngine over the in-memory store
 */

#include <gtest/gtest.h>
#include "application/TransactionEngine.hpp"
#include "application/LedgerBootstrap.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "utils/IdGenerator.hpp"
#include "../mocks/RecordingUnitOfWorkFactory.hpp"

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace ledger;
using namespace ledger::application;
using namespace ledger::adapters::secondary;
using namespace ledger::tests;

class TransactionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::LedgerSettings>();
        settings_->setLockTimeout(std::chrono::milliseconds(2000));
        settings_->setLockRetries(2, std::chrono::milliseconds(1));

        store_ = std::make_shared<InMemoryLedgerStore>(settings_);
        for (const auto& assetType : LedgerBootstrap::defaultAssetTypes()) {
            store_->saveIfAbsent(assetType);
        }
        store_->saveIfAbsent(domain::AssetType("OLD_TOKENS", "Old Tokens", "Retired", false));

        uowFactory_ = std::make_shared<RecordingUnitOfWorkFactory>(store_);
        engine_ = std::make_shared<TransactionEngine>(store_, store_, store_, store_, uowFactory_, settings_);
    }

    static domain::TransactionRequest request(domain::TransactionType type,
                                              const std::string& userId,
                                              const std::string& asset,
                                              const std::string& amount,
                                              const std::string& key) {
        domain::TransactionRequest req;
        req.type = type;
        req.userId = userId;
        req.assetTypeCode = asset;
        req.amount = domain::Amount::parse(amount);
        req.idempotencyKey = key;
        return req;
    }

    std::string balance(const std::string& userId, const std::string& asset) {
        return store_->balanceOf(domain::Account::makeId(userId, asset)).toString();
    }

    std::string treasury(const std::string& asset) {
        return balance("SYSTEM_TREASURY", asset);
    }

    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<InMemoryLedgerStore> store_;
    std::shared_ptr<RecordingUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<TransactionEngine> engine_;
};

using domain::TransactionType;

// ============================================================================
// TOPUP / BONUS / SPEND
// ============================================================================

TEST_F(TransactionEngineTest, Topup_MovesFromTreasuryToUser) {
    auto tx = engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "100.00", "k1"));

    EXPECT_EQ(tx.id.rfind("txn_", 0), 0u);
    EXPECT_EQ(tx.type, TransactionType::TOPUP);
    EXPECT_EQ(tx.status, domain::TransactionStatus::COMPLETED);
    EXPECT_EQ(tx.userId, "user_001");
    EXPECT_EQ(tx.amount.toString(), "100.00");

    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "100.00");
    EXPECT_EQ(treasury("GOLD_COINS"), "-100.00");
}

TEST_F(TransactionEngineTest, Bonus_SameDirectionAsTopup) {
    engine_->process(request(TransactionType::BONUS, "user_001", "LOYALTY_POINTS", "50.00", "b1"));

    EXPECT_EQ(balance("user_001", "LOYALTY_POINTS"), "50.00");
    EXPECT_EQ(treasury("LOYALTY_POINTS"), "-50.00");
}

TEST_F(TransactionEngineTest, Spend_MovesFromUserToTreasury) {
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "100.00", "t1"));
    auto tx = engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "30.00", "s1"));

    EXPECT_EQ(tx.type, TransactionType::SPEND);
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "70.00");
    EXPECT_EQ(treasury("GOLD_COINS"), "-70.00");
}

TEST_F(TransactionEngineTest, Spend_ExactBalance_Allowed) {
    engine_->process(request(TransactionType::TOPUP, "user_001", "DIAMONDS", "10.00", "t1"));
    engine_->process(request(TransactionType::SPEND, "user_001", "DIAMONDS", "10.00", "s1"));

    EXPECT_EQ(balance("user_001", "DIAMONDS"), "0.00");
}

TEST_F(TransactionEngineTest, Spend_NoFunds_Rejected) {
    EXPECT_THROW(
        engine_->process(request(TransactionType::SPEND, "user_404", "GOLD_COINS", "0.01", "s1")),
        domain::InsufficientBalanceError);

    EXPECT_EQ(store_->transactionCount(), 0u);
    EXPECT_EQ(store_->entryCount(), 0u);
    EXPECT_EQ(store_->accountCount(), 0u);
    EXPECT_FALSE(store_->findById(domain::Account::makeId("user_404", "GOLD_COINS")).has_value());
}

TEST_F(TransactionEngineTest, Spend_NoAccount_ReportsZeroBalance) {
    try {
        engine_->process(request(TransactionType::SPEND, "user_404", "GOLD_COINS", "5.00", "s2"));
        FAIL() << "Expected InsufficientBalanceError";
    } catch (const domain::InsufficientBalanceError& e) {
        EXPECT_STREQ(e.what(), "Insufficient balance. Current: 0.00, Required: 5.00");
    }
    EXPECT_TRUE(uowFactory_->lockRequests().empty());
}

// ============================================================================
// SCENARIOS: replay, rejected spend, accepted spend
// ============================================================================

TEST_F(TransactionEngineTest, Scenario_ReplayReturnsSameTransaction) {
    auto first = engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "100.00", "k1"));
    auto second = engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "100.00", "k1"));

    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "100.00");
    EXPECT_EQ(store_->transactionCount(), 1u);
    EXPECT_EQ(store_->entryCount(), 2u);
}

TEST_F(TransactionEngineTest, Scenario_SpendAboveBalanceRejected) {
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "100.00", "k1"));

    try {
        engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "150.00", "k2"));
        FAIL() << "Expected InsufficientBalanceError";
    } catch (const domain::InsufficientBalanceError& e) {
        EXPECT_EQ(e.code(), "INSUFFICIENT_BALANCE");
        EXPECT_FALSE(e.retryable());
        EXPECT_NE(std::string(e.what()).find("Current: 100.00"), std::string::npos);
    }

    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "100.00");
    EXPECT_EQ(store_->transactionCount(), 1u);
    EXPECT_FALSE(store_->findByIdempotencyKey("k2").has_value());
}

TEST_F(TransactionEngineTest, Scenario_SpendWithinBalanceAccepted) {
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "100.00", "k1"));
    EXPECT_THROW(
        engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "150.00", "k2")),
        domain::InsufficientBalanceError);
    engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "40.00", "k3"));

    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "60.00");
    EXPECT_EQ(treasury("GOLD_COINS"), "-60.00");
    EXPECT_EQ(store_->transactionCount(), 2u);
}

TEST_F(TransactionEngineTest, Replay_IgnoresNewParameters) {
    auto first = engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "100.00", "k1"));
    auto replay = engine_->process(request(TransactionType::BONUS, "user_001", "GOLD_COINS", "999.00", "k1"));

    EXPECT_EQ(replay.id, first.id);
    EXPECT_EQ(replay.type, TransactionType::TOPUP);
    EXPECT_EQ(replay.amount.toString(), "100.00");
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "100.00");
}

TEST_F(TransactionEngineTest, RejectedKey_CanBeReusedLater) {
    EXPECT_THROW(
        engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "10.00", "k-retry")),
        domain::InsufficientBalanceError);

    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "10.00", "k-fund"));
    auto tx = engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "10.00", "k-retry"));

    EXPECT_EQ(tx.idempotencyKey, "k-retry");
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "0.00");
}

// ============================================================================
// VALIDATION (before any lock, no state change)
// ============================================================================

TEST_F(TransactionEngineTest, Validation_RejectsBadRequests) {
    std::vector<domain::TransactionRequest> invalid = {
        request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "0", "v1"),
        request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "-5.00", "v2"),
        request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "1000000.01", "v3"),
        request(TransactionType::TOPUP, "user_001", "SILVER", "1.00", "v4"),
        request(TransactionType::TOPUP, "user_001", "OLD_TOKENS", "1.00", "v5"),
        request(TransactionType::TOPUP, "user_001", "", "1.00", "v6"),
        request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "1.00", ""),
        request(TransactionType::TOPUP, "", "GOLD_COINS", "1.00", "v8"),
        request(TransactionType::TOPUP, "SYSTEM_TREASURY", "GOLD_COINS", "1.00", "v9"),
        request(TransactionType::REFUND, "user_001", "GOLD_COINS", "1.00", "v10"),
        request(TransactionType::ADJUSTMENT, "user_001", "GOLD_COINS", "1.00", "v11"),
        request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "1.00", std::string(256, 'k')),
        request(TransactionType::TOPUP, std::string(101, 'u'), "GOLD_COINS", "1.00", "v13"),
    };

    for (const auto& req : invalid) {
        EXPECT_THROW(engine_->process(req), domain::ValidationError)
            << "key=" << req.idempotencyKey.substr(0, 8) << " user=" << req.userId.substr(0, 16);
    }

    EXPECT_EQ(uowFactory_->beginCount(), 0);
    EXPECT_EQ(store_->transactionCount(), 0u);
    EXPECT_EQ(store_->accountCount(), 0u);
}

TEST_F(TransactionEngineTest, Validation_BoundsAreInclusive) {
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "0.01", "min"));
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "1000000.00", "max"));

    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "1000000.01");
}

TEST_F(TransactionEngineTest, Validation_ConfiguredMinimum) {
    settings_->setAmountBounds(domain::Amount::parse("1.00"), domain::Amount::parse("10.00"));

    EXPECT_THROW(
        engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "0.99", "lo")),
        domain::ValidationError);
    EXPECT_THROW(
        engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "10.01", "hi")),
        domain::ValidationError);
    EXPECT_NO_THROW(
        engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "10.00", "ok")));
}

// ============================================================================
// JOURNAL SHAPE
// ============================================================================

TEST_F(TransactionEngineTest, Entries_BalancedPairForTopup) {
    auto tx = engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "25.50", "e1"));

    auto entries = engine_->getEntries(tx.id);
    ASSERT_EQ(entries.size(), 2u);

    for (const auto& entry : entries) {
        EXPECT_EQ(entry.transactionId, tx.id);
        EXPECT_EQ(entry.assetTypeCode, "GOLD_COINS");
        EXPECT_EQ(entry.amount.toString(), "25.50");
        EXPECT_EQ(entry.debitAccountId(), "user_001:GOLD_COINS");
        EXPECT_EQ(entry.creditAccountId(), "SYSTEM_TREASURY:GOLD_COINS");
        EXPECT_EQ(entry.id.rfind("led_", 0), 0u);
    }
    EXPECT_NE(entries[0].side, entries[1].side);
    EXPECT_NE(entries[0].id, entries[1].id);
}

TEST_F(TransactionEngineTest, Entries_SpendReversesDirection) {
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "50.00", "e1"));
    auto tx = engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "20.00", "e2"));

    auto entries = engine_->getEntries(tx.id);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].debitAccountId(), "SYSTEM_TREASURY:GOLD_COINS");
    EXPECT_EQ(entries[0].creditAccountId(), "user_001:GOLD_COINS");
}

TEST_F(TransactionEngineTest, Journal_SumsToZeroPerAsset) {
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "1000.00", "z1"));
    engine_->process(request(TransactionType::TOPUP, "user_002", "GOLD_COINS", "500.00", "z2"));
    engine_->process(request(TransactionType::BONUS, "user_001", "DIAMONDS", "100.00", "z3"));
    engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "333.33", "z4"));
    engine_->process(request(TransactionType::SPEND, "user_001", "DIAMONDS", "0.01", "z5"));

    EXPECT_TRUE(store_->totalOf("GOLD_COINS").isZero());
    EXPECT_TRUE(store_->totalOf("DIAMONDS").isZero());
    EXPECT_TRUE(store_->totalOf("LOYALTY_POINTS").isZero());
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "666.67");
}

TEST_F(TransactionEngineTest, Balance_IndependentOfEntryOrder) {
    auto forward = std::make_shared<InMemoryLedgerStore>(settings_);
    auto reversed = std::make_shared<InMemoryLedgerStore>(settings_);

    struct Posting {
        std::string debitUser;
        std::string creditUser;
        std::string asset;
        std::string amount;
    };
    const std::vector<Posting> postings = {
        {"user_001", "SYSTEM_TREASURY", "GOLD_COINS", "100.00"},
        {"SYSTEM_TREASURY", "user_001", "GOLD_COINS", "40.25"},
        {"user_002", "SYSTEM_TREASURY", "GOLD_COINS", "12.50"},
        {"user_001", "SYSTEM_TREASURY", "DIAMONDS", "7.00"},
        {"SYSTEM_TREASURY", "user_002", "GOLD_COINS", "12.49"},
        {"SYSTEM_TREASURY", "user_001", "DIAMONDS", "0.01"},
        {"user_002", "SYSTEM_TREASURY", "LOYALTY_POINTS", "3.33"},
    };

    std::set<std::string> accountIds;
    for (const auto& target : {forward, reversed}) {
        for (const auto& assetType : LedgerBootstrap::defaultAssetTypes()) {
            target->saveIfAbsent(assetType);
        }
        for (const auto& p : postings) {
            for (const auto& userId : {p.debitUser, p.creditUser}) {
                auto kind = userId == "SYSTEM_TREASURY" ? domain::AccountKind::SYSTEM : domain::AccountKind::USER;
                accountIds.insert(target->resolveOrCreate(userId, p.asset, kind).id);
            }
        }
    }

    std::vector<domain::EntryPair> pairs;
    for (size_t i = 0; i < postings.size(); ++i) {
        const auto& p = postings[i];
        pairs.push_back(domain::EntryPair::make(
            "txn_order_" + std::to_string(i),
            domain::Account::makeId(p.debitUser, p.asset),
            domain::Account::makeId(p.creditUser, p.asset),
            p.asset,
            domain::Amount::parse(p.amount),
            utils::IdGenerator::entryId(),
            utils::IdGenerator::entryId(),
            domain::Timestamp::now()));
    }

    auto commitPair = [](InMemoryLedgerStore& target, const domain::EntryPair& pair) {
        auto uow = target.begin();
        uow->lockAccounts(TransactionEngine::lockOrder(pair.debit.accountId, pair.credit.accountId));
        uow->append(pair);
        uow->commit();
    };
    for (auto it = pairs.begin(); it != pairs.end(); ++it) {
        commitPair(*forward, *it);
    }
    for (auto it = pairs.rbegin(); it != pairs.rend(); ++it) {
        commitPair(*reversed, *it);
    }

    for (const auto& accountId : accountIds) {
        EXPECT_EQ(forward->balanceOf(accountId).toString(), reversed->balanceOf(accountId).toString())
            << accountId;
    }
    for (const auto& asset : {"GOLD_COINS", "DIAMONDS", "LOYALTY_POINTS"}) {
        EXPECT_EQ(forward->totalOf(asset).toString(), reversed->totalOf(asset).toString()) << asset;
        EXPECT_TRUE(forward->totalOf(asset).isZero()) << asset;
    }
    EXPECT_EQ(forward->balanceOf("user_001:GOLD_COINS").toString(), "59.75");
    EXPECT_EQ(reversed->balanceOf("user_002:GOLD_COINS").toString(), "0.01");
}

TEST_F(TransactionEngineTest, AccountIds_UnderscoredPairsStayApart) {
    store_->saveIfAbsent(domain::AssetType("COINS", "Coins"));

    // "x_GOLD" + "COINS" и "x" + "GOLD_COINS" склеились бы через '_'
    engine_->process(request(TransactionType::TOPUP, "x_GOLD", "COINS", "3.00", "u1"));
    engine_->process(request(TransactionType::TOPUP, "x", "GOLD_COINS", "7.00", "u2"));

    EXPECT_EQ(balance("x_GOLD", "COINS"), "3.00");
    EXPECT_EQ(balance("x", "GOLD_COINS"), "7.00");
    EXPECT_NE(domain::Account::makeId("x_GOLD", "COINS"), domain::Account::makeId("x", "GOLD_COINS"));
}

TEST_F(TransactionEngineTest, Versions_IncrementOnEachWrite) {
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "10.00", "v1"));
    engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "5.00", "v2"));

    EXPECT_EQ(store_->findById("user_001:GOLD_COINS")->version, 2);
    EXPECT_EQ(store_->findById("SYSTEM_TREASURY:GOLD_COINS")->version, 2);
}

TEST_F(TransactionEngineTest, Metadata_StoredVerbatim) {
    auto req = request(TransactionType::SPEND, "user_001", "GOLD_COINS", "1.00", "m1");
    req.metadata = nlohmann::json::parse(R"({"item":"sword","tags":["rare",1],"nested":{"a":null}})");
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "1.00", "m0"));

    auto tx = engine_->process(req);
    auto stored = engine_->getTransaction(tx.id);

    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->metadata, req.metadata);
}

TEST_F(TransactionEngineTest, GetTransaction_Unknown) {
    EXPECT_FALSE(engine_->getTransaction("txn_doesnotexist").has_value());
    EXPECT_TRUE(engine_->getEntries("txn_doesnotexist").empty());
}

// ============================================================================
// LOCK ORDER
// ============================================================================

TEST_F(TransactionEngineTest, LockOrder_IsLexicographic) {
    EXPECT_EQ(TransactionEngine::lockOrder("b", "a"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(TransactionEngine::lockOrder("a", "b"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(TransactionEngine::lockOrder("a", "a"), (std::vector<std::string>{"a"}));
}

TEST_F(TransactionEngineTest, LockOrder_IndependentOfDirection) {
    // "AAA_..." < "SYSTEM_..." < "user_..."
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "10.00", "o1"));
    engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "5.00", "o2"));
    engine_->process(request(TransactionType::TOPUP, "AAA", "GOLD_COINS", "10.00", "o3"));
    engine_->process(request(TransactionType::SPEND, "AAA", "GOLD_COINS", "5.00", "o4"));

    auto requests = uowFactory_->lockRequests();
    ASSERT_EQ(requests.size(), 4u);

    std::vector<std::string> treasuryFirst = {"SYSTEM_TREASURY:GOLD_COINS", "user_001:GOLD_COINS"};
    EXPECT_EQ(requests[0], treasuryFirst);
    EXPECT_EQ(requests[1], treasuryFirst);

    std::vector<std::string> userFirst = {"AAA:GOLD_COINS", "SYSTEM_TREASURY:GOLD_COINS"};
    EXPECT_EQ(requests[2], userFirst);
    EXPECT_EQ(requests[3], userFirst);
}

// ============================================================================
// TRANSIENT FAILURES
// ============================================================================

TEST_F(TransactionEngineTest, Retry_LockTimeoutThenSuccess) {
    uowFactory_->failNextLocks(2);

    auto tx = engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "10.00", "r1"));

    EXPECT_EQ(uowFactory_->beginCount(), 3);
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "10.00");
    EXPECT_EQ(store_->transactionCount(), 1u);
    EXPECT_EQ(engine_->getTransaction(tx.id)->idempotencyKey, "r1");
}

TEST_F(TransactionEngineTest, Retry_ExhaustedSurfacesRetryableConflict) {
    uowFactory_->failNextLocks(3);

    try {
        engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "10.00", "r2"));
        FAIL() << "Expected ConflictError";
    } catch (const domain::ConflictError& e) {
        EXPECT_TRUE(e.retryable());
        EXPECT_EQ(e.code(), "LOCK_TIMEOUT");
    }

    EXPECT_EQ(uowFactory_->beginCount(), 3);
    EXPECT_EQ(store_->transactionCount(), 0u);
    EXPECT_EQ(store_->entryCount(), 0u);
}

TEST_F(TransactionEngineTest, Retry_CommitFailureLeavesNoPartialWrite) {
    uowFactory_->failNextCommits(1);

    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "10.00", "r3"));

    EXPECT_EQ(store_->transactionCount(), 1u);
    EXPECT_EQ(store_->entryCount(), 2u);
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "10.00");
    EXPECT_EQ(store_->findById("user_001:GOLD_COINS")->version, 1);
}

TEST_F(TransactionEngineTest, Retry_UpToConfiguredMaximum) {
    settings_->setLockRetries(settings::LedgerSettings::MAX_LOCK_RETRIES, std::chrono::milliseconds(0));
    uowFactory_->failNextLocks(settings::LedgerSettings::MAX_LOCK_RETRIES);

    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "10.00", "r4"));

    EXPECT_EQ(uowFactory_->beginCount(), settings::LedgerSettings::MAX_LOCK_RETRIES + 1);
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "10.00");
}

TEST_F(TransactionEngineTest, DuplicateKeyOnInsert_ReturnsWinner) {
    domain::Transaction competitor;
    uowFactory_->beforeNextInsert([&] {
        competitor = engine_->process(request(TransactionType::TOPUP, "user_002", "DIAMONDS", "5.00", "race"));
    });

    auto tx = engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "100.00", "race"));

    EXPECT_EQ(tx.id, competitor.id);
    EXPECT_EQ(tx.userId, "user_002");
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "0.00");
    EXPECT_EQ(store_->transactionCount(), 1u);
    EXPECT_EQ(store_->entryCount(), 2u);
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(TransactionEngineTest, Concurrent_SameKeyConvergesToOneTransaction) {
    constexpr int THREADS = 8;
    std::vector<std::string> ids(THREADS);
    std::vector<std::thread> threads;

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&, i] {
            ids[i] = engine_->process(
                request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "100.00", "same-key")).id;
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& id : ids) {
        EXPECT_EQ(id, ids[0]);
    }
    EXPECT_EQ(store_->transactionCount(), 1u);
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "100.00");
}

TEST_F(TransactionEngineTest, Concurrent_OppositeDirectionsDoNotDeadlock) {
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "10000.00", "fund"));

    constexpr int ROUNDS = 50;
    std::thread topups([&] {
        for (int i = 0; i < ROUNDS; ++i) {
            engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "3.00",
                                     "up-" + std::to_string(i)));
        }
    });
    std::thread spends([&] {
        for (int i = 0; i < ROUNDS; ++i) {
            engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "2.00",
                                     "down-" + std::to_string(i)));
        }
    });
    topups.join();
    spends.join();

    // 10000 + 50 * 3 - 50 * 2
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "10050.00");
    EXPECT_TRUE(store_->totalOf("GOLD_COINS").isZero());
    EXPECT_EQ(store_->transactionCount(), 1u + 2u * ROUNDS);
}

TEST_F(TransactionEngineTest, Concurrent_SpendsNeverOverdraw) {
    engine_->process(request(TransactionType::TOPUP, "user_001", "GOLD_COINS", "100.00", "fund"));

    constexpr int THREADS = 20;
    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&, i] {
            try {
                engine_->process(request(TransactionType::SPEND, "user_001", "GOLD_COINS", "10.00",
                                         "spend-" + std::to_string(i)));
                ++accepted;
            } catch (const domain::InsufficientBalanceError&) {
                ++rejected;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(accepted.load(), 10);
    EXPECT_EQ(rejected.load(), 10);
    EXPECT_EQ(balance("user_001", "GOLD_COINS"), "0.00");
}

TEST_F(TransactionEngineTest, Concurrent_DisjointUsersAllCommit) {
    constexpr int THREADS = 10;
    std::vector<std::thread> threads;

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&, i] {
            auto user = "user_" + std::to_string(100 + i);
            engine_->process(request(TransactionType::TOPUP, user, "DIAMONDS", "7.00", "d-" + user));
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(store_->transactionCount(), static_cast<size_t>(THREADS));
    EXPECT_EQ(treasury("DIAMONDS"), "-70.00");
}
