#pragma once

#include "application/projections/AbstractProjector.hpp"
#include "domain/account/events/MoneyDepositedEvent.hpp"
#include "domain/account/events/MoneyWithdrawnEvent.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace eventstore::application {

struct TransactionEntry {
    std::string eventId;
    std::string accountId;
    std::string kind;       ///< deposit | withdrawal
    int64_t amount = 0;
    std::string reference;
    domain::Timestamp occurredOn;
};

/**
 * @brief Журнал движений по счетам (только зачисления и списания)
 */
class TransactionHistoryProjector : public AbstractProjector {
public:
    static constexpr const char* NAME = "transaction_history";

    TransactionHistoryProjector() {
        when(domain::MoneyDepositedEvent::TYPE, &TransactionHistoryProjector::onDeposited);
        when(domain::MoneyWithdrawnEvent::TYPE, &TransactionHistoryProjector::onWithdrawn);
    }

    std::string getName() const override { return NAME; }

    void reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    std::vector<TransactionEntry> getHistory(const std::string& accountId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<TransactionEntry> result;
        for (const auto& entry : entries_) {
            if (entry.accountId == accountId) {
                result.push_back(entry);
            }
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    void onDeposited(const domain::MoneyDepositedEvent& event) {
        add(event, "deposit", event.amount, event.reference);
    }

    void onWithdrawn(const domain::MoneyWithdrawnEvent& event) {
        add(event, "withdrawal", event.amount, event.reference);
    }

    void add(const domain::DomainEvent& event, const char* kind, int64_t amount, const std::string& reference) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back({event.eventId, event.aggregateId.value_or(""), kind, amount, reference,
                            event.occurredOn});
    }

    mutable std::mutex mutex_;
    std::vector<TransactionEntry> entries_;
};

} // namespace eventstore::application
