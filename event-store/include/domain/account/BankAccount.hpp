// include/domain/account/BankAccount.hpp
#pragma once

#include "domain/EventSourcedAggregate.hpp"
#include "domain/account/AccountConstants.hpp"
#include "domain/account/events/AccountOpenedEvent.hpp"
#include "domain/account/events/AccountRenamedEvent.hpp"
#include "domain/account/events/MoneyDepositedEvent.hpp"
#include "domain/account/events/MoneyWithdrawnEvent.hpp"
#include "domain/account/events/AccountClosedEvent.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace eventstore::domain {

enum class AccountStatus {
    NEW,      ///< Агрегат создан, но AccountOpened ещё не применён
    OPEN,
    CLOSED
};

std::string toString(AccountStatus status);
AccountStatus accountStatusFromString(const std::string& s);

/**
 * @brief Банковский счёт - пример агрегата с event sourcing
 *
 * Команды проверяют инварианты и записывают события; состояние
 * меняется только в apply-методах.
 */
class BankAccount : public EventSourcedAggregate<BankAccount> {
public:
    explicit BankAccount(const std::string& id) : EventSourcedAggregate(id) {}

    /**
     * @brief Открыть новый счёт
     * @throws InvariantViolationException пустое имя владельца или валюта
     */
    static BankAccount open(const std::string& id,
                            const std::string& holderName,
                            const std::string& currency);

    void rename(const std::string& newHolderName);
    void deposit(int64_t amount, const std::string& reference = "");
    void withdraw(int64_t amount, const std::string& reference = "");

    /**
     * @brief Закрыть счёт (баланс должен быть нулевым)
     */
    void close(const std::string& reason);

    const std::string& getHolderName() const { return holderName_; }
    const std::string& getCurrency() const { return currency_; }
    int64_t getBalance() const { return balance_; }
    AccountStatus getStatus() const { return status_; }
    bool isOpen() const { return status_ == AccountStatus::OPEN; }

    // Контракт EventSourcedAggregate
    static const ApplierTable& appliers();
    static std::string aggregateTypeName() { return BANK_ACCOUNT_TYPE; }
    nlohmann::json snapshotState() const;
    void restoreState(const nlohmann::json& state);

    bool operator==(const BankAccount& other) const;
    bool operator!=(const BankAccount& other) const { return !(*this == other); }

private:
    void requireOpen() const;

    void applyOpened(const AccountOpenedEvent& event);
    void applyRenamed(const AccountRenamedEvent& event);
    void applyDeposited(const MoneyDepositedEvent& event);
    void applyWithdrawn(const MoneyWithdrawnEvent& event);
    void applyClosed(const AccountClosedEvent& event);

    std::string holderName_;
    std::string currency_;
    int64_t balance_ = 0;
    AccountStatus status_ = AccountStatus::NEW;
};

} // namespace eventstore::domain
