#include "domain/account/BankAccount.hpp"
#include "domain/Exceptions.hpp"
#include <limits>
#include <memory>

namespace eventstore::domain {

std::string toString(AccountStatus status) {
    switch (status) {
        case AccountStatus::NEW: return "NEW";
        case AccountStatus::OPEN: return "OPEN";
        case AccountStatus::CLOSED: return "CLOSED";
        default: return "NEW";
    }
}

AccountStatus accountStatusFromString(const std::string& s) {
    if (s == "OPEN") return AccountStatus::OPEN;
    if (s == "CLOSED") return AccountStatus::CLOSED;
    if (s == "NEW") return AccountStatus::NEW;
    throw std::invalid_argument("Unknown account status: " + s);
}

// ============================================================================
// COMMANDS
// ============================================================================

BankAccount BankAccount::open(const std::string& id,
                              const std::string& holderName,
                              const std::string& currency) {
    if (holderName.empty()) {
        throw InvariantViolationException("Holder name must not be empty");
    }
    if (currency.size() != 3) {
        throw InvariantViolationException("Currency must be a 3-letter code: " + currency);
    }

    BankAccount account(id);
    account.recordEvent(std::make_shared<AccountOpenedEvent>(id, holderName, currency));
    return account;
}

void BankAccount::rename(const std::string& newHolderName) {
    requireOpen();
    if (newHolderName.empty()) {
        throw InvariantViolationException("Holder name must not be empty");
    }
    if (newHolderName == holderName_) {
        return;
    }
    recordEvent(std::make_shared<AccountRenamedEvent>(getId(), newHolderName));
}

void BankAccount::deposit(int64_t amount, const std::string& reference) {
    requireOpen();
    if (amount <= 0) {
        throw InvariantViolationException("Deposit amount must be positive");
    }
    if (amount > std::numeric_limits<int64_t>::max() - balance_) {
        throw InvariantViolationException("Deposit of " + std::to_string(amount) + " to account " + getId() +
                                          " would overflow balance " + std::to_string(balance_));
    }
    recordEvent(std::make_shared<MoneyDepositedEvent>(getId(), amount, reference));
}

void BankAccount::withdraw(int64_t amount, const std::string& reference) {
    requireOpen();
    if (amount <= 0) {
        throw InvariantViolationException("Withdrawal amount must be positive");
    }
    if (amount > balance_) {
        throw InvariantViolationException("Insufficient funds on account " + getId() +
                                          ": balance " + std::to_string(balance_) +
                                          ", requested " + std::to_string(amount));
    }
    recordEvent(std::make_shared<MoneyWithdrawnEvent>(getId(), amount, reference));
}

void BankAccount::close(const std::string& reason) {
    requireOpen();
    if (balance_ != 0) {
        throw InvariantViolationException("Cannot close account " + getId() +
                                          " with non-zero balance");
    }
    recordEvent(std::make_shared<AccountClosedEvent>(getId(), reason));
}

void BankAccount::requireOpen() const {
    if (status_ != AccountStatus::OPEN) {
        throw InvariantViolationException("Account " + getId() + " is " + toString(status_));
    }
}

// ============================================================================
// APPLIERS
// ============================================================================

const BankAccount::ApplierTable& BankAccount::appliers() {
    static const ApplierTable table = {
        on<AccountOpenedEvent>(AccountOpenedEvent::TYPE, &BankAccount::applyOpened),
        on<AccountRenamedEvent>(AccountRenamedEvent::TYPE, &BankAccount::applyRenamed),
        on<MoneyDepositedEvent>(MoneyDepositedEvent::TYPE, &BankAccount::applyDeposited),
        on<MoneyWithdrawnEvent>(MoneyWithdrawnEvent::TYPE, &BankAccount::applyWithdrawn),
        on<AccountClosedEvent>(AccountClosedEvent::TYPE, &BankAccount::applyClosed),
    };
    return table;
}

void BankAccount::applyOpened(const AccountOpenedEvent& event) {
    holderName_ = event.holderName;
    currency_ = event.currency;
    balance_ = 0;
    status_ = AccountStatus::OPEN;
}

void BankAccount::applyRenamed(const AccountRenamedEvent& event) {
    holderName_ = event.holderName;
}

void BankAccount::applyDeposited(const MoneyDepositedEvent& event) {
    balance_ += event.amount;
}

void BankAccount::applyWithdrawn(const MoneyWithdrawnEvent& event) {
    balance_ -= event.amount;
}

void BankAccount::applyClosed(const AccountClosedEvent&) {
    status_ = AccountStatus::CLOSED;
}

// ============================================================================
// SNAPSHOT STATE
// ============================================================================

nlohmann::json BankAccount::snapshotState() const {
    nlohmann::json j;
    j["holderName"] = holderName_;
    j["currency"] = currency_;
    j["balance"] = balance_;
    j["status"] = toString(status_);
    return j;
}

void BankAccount::restoreState(const nlohmann::json& state) {
    holderName_ = state.at("holderName").get<std::string>();
    currency_ = state.at("currency").get<std::string>();
    balance_ = state.at("balance").get<int64_t>();
    status_ = accountStatusFromString(state.at("status").get<std::string>());
}

bool BankAccount::operator==(const BankAccount& other) const {
    return getId() == other.getId()
        && getVersion() == other.getVersion()
        && holderName_ == other.holderName_
        && currency_ == other.currency_
        && balance_ == other.balance_
        && status_ == other.status_;
}

} // namespace eventstore::domain
