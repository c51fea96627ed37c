#include "domain/account/events/MoneyDepositedEvent.hpp"
#include <nlohmann/json.hpp>

namespace eventstore::domain {

nlohmann::json MoneyDepositedEvent::payload() const {
    nlohmann::json j;
    j["amount"] = amount;
    j["reference"] = reference;
    return j;
}

} // namespace eventstore::domain
