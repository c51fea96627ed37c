/**
 * @file EventSourcedAggregateTest.cpp
 * @brief Версионирование, replay и снимки базового агрегата
 */

#include <gtest/gtest.h>
#include "domain/account/BankAccount.hpp"
#include "../mocks/EventFixtures.hpp"

using namespace eventstore;
using namespace eventstore::domain;
using namespace eventstore::tests;

// ============================================================================
// LIVE MUTATION
// ============================================================================

TEST(EventSourcedAggregateTest, RecordEvent_BumpsVersionAndBuffers) {
    auto account = BankAccount::open("acc-1", "Alice", "EUR");
    account.deposit(100);
    account.deposit(50);

    EXPECT_EQ(account.getVersion(), 3);
    EXPECT_EQ(account.getPersistedVersion(), 0);
    ASSERT_EQ(account.getPendingEvents().size(), 3u);
    EXPECT_EQ(account.getPendingEvents()[0]->eventType, AccountOpenedEvent::TYPE);
    EXPECT_EQ(account.getPendingEvents()[2]->eventType, MoneyDepositedEvent::TYPE);
}

TEST(EventSourcedAggregateTest, PullPendingEvents_ClearsBufferKeepsVersion) {
    auto account = BankAccount::open("acc-1", "Alice", "EUR");
    account.deposit(100);

    auto pulled = account.pullPendingEvents();

    EXPECT_EQ(pulled.size(), 2u);
    EXPECT_FALSE(account.hasPendingEvents());
    EXPECT_EQ(account.getVersion(), 2);
    EXPECT_EQ(account.getPersistedVersion(), 2);
}

TEST(EventSourcedAggregateTest, Constructor_EmptyId_Throws) {
    EXPECT_THROW(BankAccount(""), std::invalid_argument);
}

// ============================================================================
// RECONSTITUTION
// ============================================================================

TEST(EventSourcedAggregateTest, Reconstitute_OpenedAndRenamed_VersionTwo) {
    auto account = BankAccount::reconstituteFromEvents({
        opened("42", "Initial"),
        renamed("42", "X")
    });

    EXPECT_EQ(account.getId(), "42");
    EXPECT_EQ(account.getVersion(), 2);
    EXPECT_EQ(account.getHolderName(), "X");
    EXPECT_FALSE(account.hasPendingEvents());
}

TEST(EventSourcedAggregateTest, Reconstitute_EmptyStream_Throws) {
    EXPECT_THROW(BankAccount::reconstituteFromEvents({}), ReconstitutionException);
}

TEST(EventSourcedAggregateTest, Reconstitute_FirstEventWithoutAggregateId_Throws) {
    EXPECT_THROW(BankAccount::reconstituteFromEvents({generic("system.tick")}), ReconstitutionException);
}

TEST(EventSourcedAggregateTest, Reconstitute_ForeignEvent_Throws) {
    EXPECT_THROW(BankAccount::reconstituteFromEvents({opened("a"), deposited("b", 10)}),
                 ReconstitutionException);
}

TEST(EventSourcedAggregateTest, Reconstitute_NullEventInStream_Throws) {
    std::vector<EventPtr> events{opened("a"), deposited("a", 10), nullptr, deposited("a", 5)};

    EXPECT_THROW(BankAccount::reconstituteFromEvents(events), ReconstitutionException);
}

TEST(EventSourcedAggregateTest, Replay_UnknownType_NoStateChangeButVersionCounts) {
    auto account = BankAccount::reconstituteFromEvents({
        opened("acc-1"),
        generic("account.audited", std::string("acc-1")),
        deposited("acc-1", 30)
    });

    EXPECT_EQ(account.getVersion(), 3);
    EXPECT_EQ(account.getBalance(), 30);
}

TEST(EventSourcedAggregateTest, Replay_RegisteredTypeWithWrongObject_ThrowsCorrupt) {
    // Тип account.deposited, но объект не MoneyDepositedEvent
    auto bogus = generic(MoneyDepositedEvent::TYPE, std::string("acc-1"));

    EXPECT_THROW(BankAccount::reconstituteFromEvents({opened("acc-1"), bogus}), CorruptEventException);
}

TEST(EventSourcedAggregateTest, Replay_SameStreamTwice_Deterministic) {
    auto history = accountHistory("acc-1", 7);
    history.push_back(withdrawn("acc-1", 25));

    auto first = BankAccount::reconstituteFromEvents(history);
    auto second = BankAccount::reconstituteFromEvents(history);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first.getBalance(), 45);
}

// ============================================================================
// SNAPSHOTS
// ============================================================================

TEST(EventSourcedAggregateTest, FromSnapshot_RestoresStateAndVersion) {
    auto original = BankAccount::reconstituteFromEvents(accountHistory("acc-1", 4));
    auto snapshot = original.takeSnapshot();

    auto restored = BankAccount::fromSnapshot(snapshot);

    EXPECT_EQ(snapshot.version, 5);
    EXPECT_EQ(snapshot.aggregateType, BANK_ACCOUNT_TYPE);
    EXPECT_EQ(restored, original);
}

TEST(EventSourcedAggregateTest, FromSnapshot_OtherAggregateType_Throws) {
    auto snapshot = BankAccount::reconstituteFromEvents(accountHistory("acc-1", 1)).takeSnapshot();
    snapshot.aggregateType = "customer";

    EXPECT_THROW(BankAccount::fromSnapshot(snapshot), std::invalid_argument);
}
