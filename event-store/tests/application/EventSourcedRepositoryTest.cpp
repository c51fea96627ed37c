/**
 * @file EventSourcedRepositoryTest.cpp
 * @brief Загрузка через снимки, сохранение и устойчивость к сбоям хранилищ
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/EventSourcedRepository.hpp"
#include "adapters/secondary/persistence/InMemoryEventStore.hpp"
#include "adapters/secondary/persistence/InMemorySnapshotStore.hpp"
#include "domain/account/BankAccount.hpp"
#include "../mocks/EventFixtures.hpp"
#include "../mocks/MockEventStore.hpp"
#include "../mocks/MockSnapshotStore.hpp"

using namespace eventstore;
using namespace eventstore::domain;
using namespace eventstore::tests;
using application::EventSourcedRepository;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

using AccountRepository = EventSourcedRepository<BankAccount>;

class EventSourcedRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        eventStore_ = std::make_shared<adapters::secondary::InMemoryEventStore>();
        snapshotStore_ = std::make_shared<adapters::secondary::InMemorySnapshotStore>();
        repository_ = std::make_shared<AccountRepository>(
            eventStore_, snapshotStore_, std::make_shared<application::EveryNthVersionPolicy>(10));
    }

    std::shared_ptr<adapters::secondary::InMemoryEventStore> eventStore_;
    std::shared_ptr<adapters::secondary::InMemorySnapshotStore> snapshotStore_;
    std::shared_ptr<AccountRepository> repository_;
};

// ============================================================================
// FIND
// ============================================================================

TEST_F(EventSourcedRepositoryTest, FindById_NoEvents_Nullopt) {
    EXPECT_FALSE(repository_->findById("missing").has_value());
    EXPECT_FALSE(repository_->exists("missing"));
    EXPECT_EQ(eventStore_->getAggregateVersion("missing"), 0);
}

TEST_F(EventSourcedRepositoryTest, GetById_NoEvents_ThrowsNotFound) {
    EXPECT_THROW(repository_->getById("missing"), AggregateNotFoundException);
}

TEST_F(EventSourcedRepositoryTest, FindById_OpenedThenRenamed_VersionTwo) {
    eventStore_->appendAll({opened("42"), renamed("42", "X")});

    auto account = repository_->findById("42");

    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->getVersion(), 2);
    EXPECT_EQ(account->getHolderName(), "X");
}

TEST_F(EventSourcedRepositoryTest, FindById_SnapshotAtEveryVersion_EqualsFullReplay) {
    const int total = 12;
    auto history = accountHistory("acc-1", total - 1);
    history.push_back(withdrawn("acc-1", 15));
    eventStore_->appendAll(history);

    auto full = BankAccount::reconstituteFromEvents(eventStore_->getEventsForAggregate("acc-1"));

    for (int k = 1; k <= total + 1; ++k) {
        snapshotStore_->deleteSnapshots("acc-1");
        std::vector<EventPtr> prefix(history.begin(), history.begin() + k);
        auto atK = BankAccount::reconstituteFromEvents(prefix).takeSnapshot();
        snapshotStore_->saveSnapshot(atK.aggregateId, atK.aggregateType, atK.state, atK.version);

        auto loaded = repository_->findById("acc-1");

        ASSERT_TRUE(loaded.has_value()) << "k=" << k;
        EXPECT_EQ(*loaded, full) << "k=" << k;
    }
}

TEST_F(EventSourcedRepositoryTest, FindById_SnapshotAtFive_ReplaysOnlyTail) {
    auto mockStore = std::make_shared<MockEventStore>();
    auto history = accountHistory("acc-1", 7);  // версии 1..8
    auto atFive = BankAccount::reconstituteFromEvents({history.begin(), history.begin() + 5}).takeSnapshot();
    snapshotStore_->saveSnapshot(atFive.aggregateId, atFive.aggregateType, atFive.state, atFive.version);

    EXPECT_CALL(*mockStore, getEventsForAggregateFromVersion("acc-1", 5))
        .WillOnce(Return(std::vector<EventPtr>(history.begin() + 5, history.end())));
    EXPECT_CALL(*mockStore, getEventsForAggregate(_)).Times(0);

    AccountRepository repository(mockStore, snapshotStore_, nullptr);
    auto account = repository.findById("acc-1");

    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->getVersion(), 8);
    EXPECT_EQ(account->getBalance(), 70);
}

TEST_F(EventSourcedRepositoryTest, FindById_SnapshotStoreUnavailable_FallsBackToReplay) {
    auto failingSnapshots = std::make_shared<MockSnapshotStore>();
    EXPECT_CALL(*failingSnapshots, getSnapshot("acc-1"))
        .WillOnce(Throw(StorageUnavailableException("snapshot db down")));
    eventStore_->appendAll(accountHistory("acc-1", 3));

    AccountRepository repository(eventStore_, failingSnapshots, nullptr);
    auto account = repository.findById("acc-1");

    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->getBalance(), 30);
}

TEST_F(EventSourcedRepositoryTest, FindById_UnreadableSnapshotState_FallsBackToReplay) {
    eventStore_->appendAll(accountHistory("acc-1", 2));
    snapshotStore_->saveSnapshot("acc-1", BANK_ACCOUNT_TYPE, {{"garbage", true}}, 3);

    auto account = repository_->findById("acc-1");

    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->getVersion(), 3);
    EXPECT_EQ(account->getBalance(), 20);
}

TEST_F(EventSourcedRepositoryTest, FindById_CorruptSnapshot_FallsBackToReplay) {
    auto corruptSnapshots = std::make_shared<MockSnapshotStore>();
    EXPECT_CALL(*corruptSnapshots, getSnapshot("acc-1"))
        .WillOnce(Throw(CorruptSnapshotException("acc-1", "parse error at byte 1")));
    eventStore_->appendAll(accountHistory("acc-1", 4));

    AccountRepository repository(eventStore_, corruptSnapshots, nullptr);
    auto account = repository.findById("acc-1");

    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->getVersion(), 5);
    EXPECT_EQ(account->getBalance(), 40);
}

TEST_F(EventSourcedRepositoryTest, FindById_EventStoreFailure_Propagates) {
    auto mockStore = std::make_shared<MockEventStore>();
    EXPECT_CALL(*mockStore, getEventsForAggregate("acc-1"))
        .WillOnce(Throw(StorageUnavailableException("db down")));

    AccountRepository repository(mockStore, nullptr, nullptr);

    EXPECT_THROW(repository.findById("acc-1"), StorageUnavailableException);
}

TEST_F(EventSourcedRepositoryTest, FindByIdAtVersion_PointInTime) {
    eventStore_->appendAll({opened("acc-1"), deposited("acc-1", 10), deposited("acc-1", 20)});

    auto atTwo = repository_->findByIdAtVersion("acc-1", 2);

    ASSERT_TRUE(atTwo.has_value());
    EXPECT_EQ(atTwo->getBalance(), 10);
    EXPECT_FALSE(repository_->findByIdAtVersion("acc-1", 4).has_value());
}

// ============================================================================
// SAVE
// ============================================================================

TEST_F(EventSourcedRepositoryTest, Save_NoPendingEvents_NoStoreCalls) {
    auto mockStore = std::make_shared<MockEventStore>();
    EXPECT_CALL(*mockStore, appendAll(_, _)).Times(0);
    EXPECT_CALL(*mockStore, appendAll(_)).Times(0);
    EXPECT_CALL(*mockStore, append(_)).Times(0);

    AccountRepository repository(mockStore, nullptr, nullptr);
    auto account = BankAccount::reconstituteFromEvents(accountHistory("acc-1", 1));

    EXPECT_TRUE(repository.save(account).empty());
}

TEST_F(EventSourcedRepositoryTest, Save_AppendsAndDrainsPending) {
    auto account = BankAccount::open("acc-1", "Alice", "EUR");
    account.deposit(100);

    auto stored = repository_->save(account);

    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[1].aggregateVersion, 2);
    EXPECT_FALSE(account.hasPendingEvents());
    EXPECT_EQ(repository_->getById("acc-1"), account);
}

TEST_F(EventSourcedRepositoryTest, Save_ConcurrentModification_ThrowsAndKeepsPending) {
    auto account = BankAccount::open("acc-1", "Alice", "EUR");
    repository_->save(account);

    auto first = repository_->getById("acc-1");
    auto second = repository_->getById("acc-1");
    first.deposit(10);
    second.deposit(20);
    repository_->save(first);

    EXPECT_THROW(repository_->save(second), ConcurrencyConflictException);
    EXPECT_TRUE(second.hasPendingEvents());
    EXPECT_EQ(eventStore_->getAggregateVersion("acc-1"), 2);
}

TEST_F(EventSourcedRepositoryTest, Save_ReachingThreshold_WritesSnapshot) {
    auto account = BankAccount::open("acc-1", "Alice", "EUR");
    for (int i = 0; i < 9; ++i) {
        account.deposit(1);
    }
    repository_->save(account);

    auto snapshot = snapshotStore_->getSnapshot("acc-1");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->version, 10);

    account.deposit(1);
    repository_->save(account);
    EXPECT_EQ(snapshotStore_->count(), 1u);
}

TEST_F(EventSourcedRepositoryTest, Save_AppendFails_NoSnapshotAndPendingKept) {
    auto mockStore = std::make_shared<MockEventStore>();
    auto mockSnapshots = std::make_shared<MockSnapshotStore>();
    EXPECT_CALL(*mockStore, appendAll(_, 0))
        .WillOnce(Throw(StorageUnavailableException("db down")));
    EXPECT_CALL(*mockSnapshots, saveSnapshot(_, _, _, _)).Times(0);

    AccountRepository repository(mockStore, mockSnapshots, std::make_shared<application::EveryNthVersionPolicy>(1));
    auto account = BankAccount::open("acc-1", "Alice", "EUR");

    EXPECT_THROW(repository.save(account), StorageUnavailableException);
    EXPECT_EQ(account.getPendingEvents().size(), 1u);
}

TEST_F(EventSourcedRepositoryTest, Save_SnapshotWriteFails_EventsStillCommitted) {
    auto mockSnapshots = std::make_shared<MockSnapshotStore>();
    EXPECT_CALL(*mockSnapshots, saveSnapshot("acc-1", BANK_ACCOUNT_TYPE, _, 1))
        .WillOnce(Throw(StorageUnavailableException("snapshot db down")));

    AccountRepository repository(eventStore_, mockSnapshots, std::make_shared<application::EveryNthVersionPolicy>(1));
    auto account = BankAccount::open("acc-1", "Alice", "EUR");

    EXPECT_NO_THROW(repository.save(account));
    EXPECT_EQ(eventStore_->getAggregateVersion("acc-1"), 1);
    EXPECT_FALSE(account.hasPendingEvents());
}
