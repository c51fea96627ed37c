#include "domain/account/events/MoneyWithdrawnEvent.hpp"
#include <nlohmann/json.hpp>

namespace eventstore::domain {

nlohmann::json MoneyWithdrawnEvent::payload() const {
    nlohmann::json j;
    j["amount"] = amount;
    j["reference"] = reference;
    return j;
}

} // namespace eventstore::domain
