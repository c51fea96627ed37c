// include/domain/account/events/MoneyDepositedEvent.hpp
#pragma once

#include "domain/events/DomainEvent.hpp"
#include "domain/account/AccountConstants.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace eventstore::domain {

/**
 * @brief Событие: зачисление на счёт
 *
 * amount - в минимальных единицах валюты (копейки, центы).
 */
struct MoneyDepositedEvent : public DomainEvent {
    static constexpr const char* TYPE = "account.deposited";

    int64_t amount = 0;
    std::string reference;

    MoneyDepositedEvent(const std::string& accountId, int64_t value, const std::string& ref = "")
        : DomainEvent(TYPE, accountId, BANK_ACCOUNT_TYPE)
        , amount(value)
        , reference(ref) {}

    explicit MoneyDepositedEvent(const EventData& data)
        : DomainEvent(data)
        , amount(data.payload.at("amount").get<int64_t>())
        , reference(data.payload.value("reference", "")) {}

    nlohmann::json payload() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<MoneyDepositedEvent>(*this);
    }
};

} // namespace eventstore::domain
