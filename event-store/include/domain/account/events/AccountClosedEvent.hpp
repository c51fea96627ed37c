// include/domain/account/events/AccountClosedEvent.hpp
#pragma once

#include "domain/events/DomainEvent.hpp"
#include "domain/account/AccountConstants.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace eventstore::domain {

/**
 * @brief Событие: счёт закрыт
 */
struct AccountClosedEvent : public DomainEvent {
    static constexpr const char* TYPE = "account.closed";

    std::string reason;

    AccountClosedEvent(const std::string& accountId, const std::string& closeReason)
        : DomainEvent(TYPE, accountId, BANK_ACCOUNT_TYPE)
        , reason(closeReason) {}

    explicit AccountClosedEvent(const EventData& data)
        : DomainEvent(data)
        , reason(data.payload.value("reason", "")) {}

    nlohmann::json payload() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<AccountClosedEvent>(*this);
    }
};

} // namespace eventstore::domain
