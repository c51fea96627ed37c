#include <gtest/gtest.h>
#include "application/EventStatsService.hpp"
#include "adapters/secondary/persistence/InMemoryEventStore.hpp"
#include "adapters/secondary/persistence/InMemorySnapshotStore.hpp"
#include "../mocks/EventFixtures.hpp"
#include "../mocks/MockEventStore.hpp"
#include <gmock/gmock.h>

using namespace eventstore;
using namespace eventstore::domain;
using namespace eventstore::tests;
using ::testing::_;
using ::testing::Return;

class EventStatsServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("EVENT_PROJECTIONS_BATCH_SIZE", "3", 1);
        store_ = std::make_shared<adapters::secondary::InMemoryEventStore>();
        snapshots_ = std::make_shared<adapters::secondary::InMemorySnapshotStore>();
        service_ = std::make_shared<application::EventStatsService>(
            store_, snapshots_, std::make_shared<settings::EventStoreSettings>());
    }

    void TearDown() override {
        unsetenv("EVENT_PROJECTIONS_BATCH_SIZE");
    }

    std::shared_ptr<adapters::secondary::InMemoryEventStore> store_;
    std::shared_ptr<adapters::secondary::InMemorySnapshotStore> snapshots_;
    std::shared_ptr<application::EventStatsService> service_;
};

TEST_F(EventStatsServiceTest, Collect_EmptyLog) {
    auto stats = service_->collect(0);

    EXPECT_EQ(stats.totalEvents, 0u);
    EXPECT_EQ(stats.uniqueAggregates, 0u);
    EXPECT_TRUE(stats.eventsByType.empty());
}

TEST_F(EventStatsServiceTest, Collect_CountsAcrossPages) {
    store_->appendAll(accountHistory("acc-1", 4));
    store_->appendAll({opened("acc-2"), withdrawn("acc-2", 1)});
    store_->append(generic("system.tick"));
    snapshots_->saveSnapshot("acc-1", "bank_account", {{"balance", 40}}, 5);

    auto stats = service_->collect(0);

    EXPECT_EQ(stats.totalEvents, 8u);
    EXPECT_EQ(stats.uniqueAggregates, 2u);
    EXPECT_EQ(stats.snapshotCount, 1u);
    ASSERT_EQ(stats.eventsByType.size(), 4u);
    EXPECT_EQ(stats.eventsByType[0].first, MoneyDepositedEvent::TYPE);
    EXPECT_EQ(stats.eventsByType[0].second, 4u);
    EXPECT_EQ(stats.eventsByType[1].first, AccountOpenedEvent::TYPE);
}

TEST_F(EventStatsServiceTest, Collect_TopTypesTruncates) {
    store_->appendAll(accountHistory("acc-1", 2));
    store_->append(generic("system.tick"));

    auto stats = service_->collect(1);

    ASSERT_EQ(stats.eventsByType.size(), 1u);
    EXPECT_EQ(stats.toJson()["eventsByType"][0]["count"], 2);
    EXPECT_EQ(stats.toJson()["totalEvents"], 4);
}

TEST_F(EventStatsServiceTest, ListEvents_ReturnsLatestInSequenceOrder) {
    auto stored = store_->appendAll(accountHistory("acc-1", 6));

    auto latest = service_->listEvents(2);

    ASSERT_EQ(latest.size(), 2u);
    EXPECT_EQ(latest[0].sequenceNumber, stored[5].sequenceNumber);
    EXPECT_EQ(latest[1].sequenceNumber, stored[6].sequenceNumber);
    EXPECT_TRUE(service_->listEvents(0).empty());
    EXPECT_EQ(service_->listEvents(100).size(), 7u);
}

TEST_F(EventStatsServiceTest, ListEvents_UsesTailQueryWithoutScanning) {
    auto mockStore = std::make_shared<MockEventStore>();
    auto events = accountHistory("acc-1", 1);
    application::EventStatsService service(mockStore, snapshots_, std::make_shared<settings::EventStoreSettings>());

    EXPECT_CALL(*mockStore, getAllEvents(_, _)).Times(0);
    EXPECT_CALL(*mockStore, getLatestEvents(2))
        .WillOnce(Return(std::vector<StoredEvent>{envelope(events[0], 41, 1), envelope(events[1], 42, 2)}));

    auto latest = service.listEvents(2);

    ASSERT_EQ(latest.size(), 2u);
    EXPECT_EQ(latest[1].sequenceNumber, 42);
}
