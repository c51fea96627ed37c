// include/domain/account/events/AccountRenamedEvent.hpp
#pragma once

#include "domain/events/DomainEvent.hpp"
#include "domain/account/AccountConstants.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace eventstore::domain {

/**
 * @brief Событие: владелец счёта переименован
 */
struct AccountRenamedEvent : public DomainEvent {
    static constexpr const char* TYPE = "account.renamed";

    std::string holderName;

    AccountRenamedEvent(const std::string& accountId, const std::string& newHolderName)
        : DomainEvent(TYPE, accountId, BANK_ACCOUNT_TYPE)
        , holderName(newHolderName) {}

    explicit AccountRenamedEvent(const EventData& data)
        : DomainEvent(data)
        , holderName(data.payload.at("holderName").get<std::string>()) {}

    nlohmann::json payload() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<AccountRenamedEvent>(*this);
    }
};

} // namespace eventstore::domain
