#include "domain/account/events/AccountRenamedEvent.hpp"
#include <nlohmann/json.hpp>

namespace eventstore::domain {

nlohmann::json AccountRenamedEvent::payload() const {
    nlohmann::json j;
    j["holderName"] = holderName;
    return j;
}

} // namespace eventstore::domain
