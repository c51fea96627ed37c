#pragma once

#include "application/projections/AbstractProjector.hpp"
#include "domain/account/events/AccountOpenedEvent.hpp"
#include "domain/account/events/AccountRenamedEvent.hpp"
#include "domain/account/events/MoneyDepositedEvent.hpp"
#include "domain/account/events/MoneyWithdrawnEvent.hpp"
#include "domain/account/events/AccountClosedEvent.hpp"
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace eventstore::application {

/**
 * @brief Строка read-модели "балансы счетов"
 */
struct AccountBalanceView {
    std::string accountId;
    std::string holderName;
    std::string currency;
    int64_t balance = 0;
    bool closed = false;
};

/**
 * @brief Проекция текущих балансов всех счетов
 */
class AccountBalancesProjector : public AbstractProjector {
public:
    static constexpr const char* NAME = "account_balances";

    AccountBalancesProjector() {
        when(domain::AccountOpenedEvent::TYPE, &AccountBalancesProjector::onOpened);
        when(domain::AccountRenamedEvent::TYPE, &AccountBalancesProjector::onRenamed);
        when(domain::MoneyDepositedEvent::TYPE, &AccountBalancesProjector::onDeposited);
        when(domain::MoneyWithdrawnEvent::TYPE, &AccountBalancesProjector::onWithdrawn);
        when(domain::AccountClosedEvent::TYPE, &AccountBalancesProjector::onClosed);
    }

    std::string getName() const override { return NAME; }

    void reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_.clear();
    }

    std::optional<AccountBalanceView> getAccount(const std::string& accountId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(accountId);
        if (it == accounts_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<AccountBalanceView> getAll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<AccountBalanceView> result;
        for (const auto& [id, view] : accounts_) {
            result.push_back(view);
        }
        return result;
    }

    /**
     * @brief Сумма балансов открытых счетов в валюте currency
     */
    int64_t getTotalBalance(const std::string& currency) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t total = 0;
        for (const auto& [id, view] : accounts_) {
            if (!view.closed && view.currency == currency) {
                total += view.balance;
            }
        }
        return total;
    }

private:
    void onOpened(const domain::AccountOpenedEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        AccountBalanceView view;
        view.accountId = event.aggregateId.value_or("");
        view.holderName = event.holderName;
        view.currency = event.currency;
        accounts_[view.accountId] = view;
    }

    void onRenamed(const domain::AccountRenamedEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_[event.aggregateId.value_or("")].holderName = event.holderName;
    }

    void onDeposited(const domain::MoneyDepositedEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& view = accounts_[event.aggregateId.value_or("")];
        if (event.amount > 0 && view.balance > std::numeric_limits<int64_t>::max() - event.amount) {
            throw std::overflow_error("balance of " + view.accountId + " overflows on event " + event.eventId);
        }
        view.balance += event.amount;
    }

    void onWithdrawn(const domain::MoneyWithdrawnEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_[event.aggregateId.value_or("")].balance -= event.amount;
    }

    void onClosed(const domain::AccountClosedEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_[event.aggregateId.value_or("")].closed = true;
    }

    mutable std::mutex mutex_;
    std::map<std::string, AccountBalanceView> accounts_;
};

} // namespace eventstore::application
