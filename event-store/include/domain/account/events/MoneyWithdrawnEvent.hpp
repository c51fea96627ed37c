// include/domain/account/events/MoneyWithdrawnEvent.hpp
#pragma once

#include "domain/events/DomainEvent.hpp"
#include "domain/account/AccountConstants.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace eventstore::domain {

/**
 * @brief Событие: списание со счёта
 */
struct MoneyWithdrawnEvent : public DomainEvent {
    static constexpr const char* TYPE = "account.withdrawn";

    int64_t amount = 0;
    std::string reference;

    MoneyWithdrawnEvent(const std::string& accountId, int64_t value, const std::string& ref = "")
        : DomainEvent(TYPE, accountId, BANK_ACCOUNT_TYPE)
        , amount(value)
        , reference(ref) {}

    explicit MoneyWithdrawnEvent(const EventData& data)
        : DomainEvent(data)
        , amount(data.payload.at("amount").get<int64_t>())
        , reference(data.payload.value("reference", "")) {}

    nlohmann::json payload() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<MoneyWithdrawnEvent>(*this);
    }
};

} // namespace eventstore::domain
