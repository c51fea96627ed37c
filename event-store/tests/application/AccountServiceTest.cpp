/**
 * @file AccountServiceTest.cpp
 * @brief Команды над счетами: запись, проекции, повтор при конфликте
 */

#include <gtest/gtest.h>
#include "application/AccountService.hpp"
#include "application/ProjectionManager.hpp"
#include "application/projections/AccountBalancesProjector.hpp"
#include "application/projections/TransactionHistoryProjector.hpp"
#include "adapters/secondary/persistence/InMemoryEventStore.hpp"
#include "adapters/secondary/persistence/InMemorySnapshotStore.hpp"
#include "domain/account/events/AccountOpenedEvent.hpp"
#include "domain/account/events/MoneyDepositedEvent.hpp"

using namespace eventstore;
using namespace eventstore::domain;
using application::AccountService;
using application::BankAccountRepository;

namespace {

/**
 * @brief Хранилище, в котором конкурент успевает дописать счёт
 *        перед первыми conflicts записями с ожидаемой версией
 */
class RacingEventStore : public adapters::secondary::InMemoryEventStore {
public:
    using InMemoryEventStore::appendAll;

    explicit RacingEventStore(int conflicts) : conflictsLeft_(conflicts) {}

    std::vector<StoredEvent> appendAll(const std::vector<EventPtr>& events, int64_t expectedVersion) override {
        if (conflictsLeft_ > 0 && !events.empty()) {
            --conflictsLeft_;
            append(std::make_shared<const MoneyDepositedEvent>(*events.front()->aggregateId, 1, "racer"));
        }
        return InMemoryEventStore::appendAll(events, expectedVersion);
    }

private:
    int conflictsLeft_;
};

} // namespace

class AccountServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::EventStoreSettings>();
        balances_ = std::make_shared<application::AccountBalancesProjector>();
        history_ = std::make_shared<application::TransactionHistoryProjector>();
        service_ = build(std::make_shared<adapters::secondary::InMemoryEventStore>());
    }

    std::shared_ptr<AccountService> build(std::shared_ptr<ports::output::IEventStore> store) {
        store_ = store;
        auto repository = std::make_shared<BankAccountRepository>(
            store_,
            std::make_shared<adapters::secondary::InMemorySnapshotStore>(),
            std::make_shared<application::EveryNthVersionPolicy>(5));
        projections_ = std::make_shared<application::ProjectionManager>(store_, settings_);
        projections_->registerProjectors({balances_, history_});
        return std::make_shared<AccountService>(repository, projections_, settings_);
    }

    std::shared_ptr<settings::EventStoreSettings> settings_;
    std::shared_ptr<ports::output::IEventStore> store_;
    std::shared_ptr<application::ProjectionManager> projections_;
    std::shared_ptr<application::AccountBalancesProjector> balances_;
    std::shared_ptr<application::TransactionHistoryProjector> history_;
    std::shared_ptr<AccountService> service_;
};

// ============================================================================
// COMMANDS
// ============================================================================

TEST_F(AccountServiceTest, OpenAccount_PersistsAndProjects) {
    auto id = service_->openAccount("Alice", "EUR");

    EXPECT_EQ(id.rfind("acc-", 0), 0u);
    EXPECT_EQ(store_->getAggregateVersion(id), 1);

    auto view = balances_->getAccount(id);
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->holderName, "Alice");
    EXPECT_EQ(view->balance, 0);
}

TEST_F(AccountServiceTest, DepositAndWithdraw_UpdateAggregateAndReadModels) {
    auto id = service_->openAccount("Alice", "EUR");
    service_->deposit(id, 300, "salary");
    service_->withdraw(id, 120, "rent");

    auto account = service_->getAccount(id);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->getBalance(), 180);
    EXPECT_EQ(account->getVersion(), 3);

    EXPECT_EQ(balances_->getAccount(id)->balance, 180);
    auto entries = history_->getHistory(id);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].kind, "deposit");
    EXPECT_EQ(entries[1].reference, "rent");
    EXPECT_EQ(projections_->getPosition(application::AccountBalancesProjector::NAME), 3);
}

TEST_F(AccountServiceTest, RenameAndClose_ReflectedInProjection) {
    auto id = service_->openAccount("Bob", "USD");
    service_->renameAccount(id, "Robert");
    service_->closeAccount(id, "moved");

    auto view = balances_->getAccount(id);
    EXPECT_EQ(view->holderName, "Robert");
    EXPECT_TRUE(view->closed);
    EXPECT_EQ(balances_->getTotalBalance("USD"), 0);
}

TEST_F(AccountServiceTest, Withdraw_InsufficientFunds_NothingStored) {
    auto id = service_->openAccount("Alice", "EUR");

    EXPECT_THROW(service_->withdraw(id, 10, "overdraft"), InvariantViolationException);
    EXPECT_EQ(store_->countForAggregate(id), 1u);
    EXPECT_EQ(history_->size(), 0u);
}

TEST_F(AccountServiceTest, Deposit_UnknownAccount_Throws) {
    EXPECT_THROW(service_->deposit("acc-missing", 10, "x"), AggregateNotFoundException);
    EXPECT_FALSE(service_->getAccount("acc-missing").has_value());
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(AccountServiceTest, Deposit_ConflictOnce_RetriedOnFreshState) {
    auto conflicting = std::make_shared<RacingEventStore>(1);
    service_ = build(conflicting);
    conflicting->append(std::make_shared<const AccountOpenedEvent>("acc-1", "Alice", "EUR"));

    service_->deposit("acc-1", 100, "salary");

    auto account = service_->getAccount("acc-1");
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->getBalance(), 101);
    EXPECT_EQ(account->getVersion(), 3);
    EXPECT_EQ(history_->getHistory("acc-1").back().reference, "salary");
}

TEST_F(AccountServiceTest, Deposit_ConflictEveryAttempt_GivesUp) {
    auto conflicting = std::make_shared<RacingEventStore>(settings_->getAppendRetries());
    service_ = build(conflicting);
    conflicting->append(std::make_shared<const AccountOpenedEvent>("acc-1", "Alice", "EUR"));

    EXPECT_THROW(service_->deposit("acc-1", 100, "salary"), ConcurrencyConflictException);
    EXPECT_EQ(conflicting->getAggregateVersion("acc-1"), 1 + settings_->getAppendRetries());
}
