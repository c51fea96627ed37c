#include "domain/account/events/AccountClosedEvent.hpp"
#include <nlohmann/json.hpp>

namespace eventstore::domain {

nlohmann::json AccountClosedEvent::payload() const {
    nlohmann::json j;
    j["reason"] = reason;
    return j;
}

} // namespace eventstore::domain
