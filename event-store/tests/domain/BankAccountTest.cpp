#include <gtest/gtest.h>
#include "domain/account/BankAccount.hpp"
#include <limits>

using namespace eventstore::domain;

class BankAccountTest : public ::testing::Test {
protected:
    void SetUp() override {
        account_ = std::make_unique<BankAccount>(BankAccount::open("acc-1", "Alice", "EUR"));
        account_->pullPendingEvents();
    }

    std::unique_ptr<BankAccount> account_;
};

// ============================================================================
// OPEN
// ============================================================================

TEST_F(BankAccountTest, Open_SetsStateAndRecordsEvent) {
    auto account = BankAccount::open("acc-2", "Bob", "USD");

    EXPECT_TRUE(account.isOpen());
    EXPECT_EQ(account.getHolderName(), "Bob");
    EXPECT_EQ(account.getCurrency(), "USD");
    EXPECT_EQ(account.getBalance(), 0);
    ASSERT_EQ(account.getPendingEvents().size(), 1u);

    auto payload = account.getPendingEvents()[0]->payload();
    EXPECT_EQ(payload["holderName"], "Bob");
    EXPECT_EQ(payload["currency"], "USD");
}

TEST_F(BankAccountTest, Open_InvalidCurrency_Throws) {
    EXPECT_THROW(BankAccount::open("acc-2", "Bob", "EURO"), InvariantViolationException);
    EXPECT_THROW(BankAccount::open("acc-2", "", "EUR"), InvariantViolationException);
}

// ============================================================================
// MONEY
// ============================================================================

TEST_F(BankAccountTest, DepositAndWithdraw_UpdateBalance) {
    account_->deposit(1000, "salary");
    account_->withdraw(300, "rent");

    EXPECT_EQ(account_->getBalance(), 700);
    EXPECT_EQ(account_->getVersion(), 3);
}

TEST_F(BankAccountTest, Withdraw_InsufficientFunds_NoEventRecorded) {
    account_->deposit(100);
    account_->pullPendingEvents();

    EXPECT_THROW(account_->withdraw(101), InvariantViolationException);
    EXPECT_FALSE(account_->hasPendingEvents());
    EXPECT_EQ(account_->getVersion(), 2);
}

TEST_F(BankAccountTest, Deposit_NonPositive_Throws) {
    EXPECT_THROW(account_->deposit(0), InvariantViolationException);
    EXPECT_THROW(account_->deposit(-5), InvariantViolationException);
}

TEST_F(BankAccountTest, Deposit_WouldOverflowBalance_ThrowsAndKeepsState) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    account_->deposit(max, "jackpot");
    account_->pullPendingEvents();

    EXPECT_THROW(account_->deposit(max, "second jackpot"), InvariantViolationException);
    EXPECT_THROW(account_->deposit(1), InvariantViolationException);
    EXPECT_EQ(account_->getBalance(), max);
    EXPECT_FALSE(account_->hasPendingEvents());

    account_->withdraw(1);
    EXPECT_NO_THROW(account_->deposit(1));
    EXPECT_EQ(account_->getBalance(), max);
}

// ============================================================================
// RENAME / CLOSE
// ============================================================================

TEST_F(BankAccountTest, Rename_SameName_NoEvent) {
    account_->rename("Alice");
    EXPECT_FALSE(account_->hasPendingEvents());

    account_->rename("Alicia");
    EXPECT_EQ(account_->getHolderName(), "Alicia");
    EXPECT_EQ(account_->getPendingEvents().size(), 1u);
}

TEST_F(BankAccountTest, Close_NonZeroBalance_Throws) {
    account_->deposit(1);
    EXPECT_THROW(account_->close("bye"), InvariantViolationException);
}

TEST_F(BankAccountTest, Close_ThenDeposit_Throws) {
    account_->close("bye");

    EXPECT_EQ(account_->getStatus(), AccountStatus::CLOSED);
    EXPECT_THROW(account_->deposit(10), InvariantViolationException);
}

// ============================================================================
// SNAPSHOT STATE
// ============================================================================

TEST_F(BankAccountTest, RestoreState_UnknownStatus_Throws) {
    auto state = account_->snapshotState();
    state["status"] = "FROZEN";

    BankAccount target("acc-1");
    EXPECT_THROW(target.restoreState(state), std::invalid_argument);
}

TEST_F(BankAccountTest, RestoreState_MissingField_ThrowsJsonError) {
    BankAccount target("acc-1");
    EXPECT_THROW(target.restoreState(nlohmann::json{{"holderName", "A"}}), nlohmann::json::exception);
}
