// include/domain/account/events/AccountOpenedEvent.hpp
#pragma once

#include "domain/events/DomainEvent.hpp"
#include "domain/account/AccountConstants.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace eventstore::domain {

/**
 * @brief Событие: счёт открыт
 */
struct AccountOpenedEvent : public DomainEvent {
    static constexpr const char* TYPE = "account.opened";

    std::string holderName;
    std::string currency;

    AccountOpenedEvent(const std::string& accountId,
                       const std::string& holder,
                       const std::string& currencyCode)
        : DomainEvent(TYPE, accountId, BANK_ACCOUNT_TYPE)
        , holderName(holder)
        , currency(currencyCode) {}

    /// Декодирование из хранилища; бросает nlohmann::json::exception на битом payload
    explicit AccountOpenedEvent(const EventData& data)
        : DomainEvent(data)
        , holderName(data.payload.at("holderName").get<std::string>())
        , currency(data.payload.at("currency").get<std::string>()) {}

    nlohmann::json payload() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<AccountOpenedEvent>(*this);
    }
};

} // namespace eventstore::domain
