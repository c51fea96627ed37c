#include "domain/account/events/AccountOpenedEvent.hpp"
#include <nlohmann/json.hpp>

namespace eventstore::domain {

nlohmann::json AccountOpenedEvent::payload() const {
    nlohmann::json j;
    j["holderName"] = holderName;
    j["currency"] = currency;
    return j;
}

} // namespace eventstore::domain
