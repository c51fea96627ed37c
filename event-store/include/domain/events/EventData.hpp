#pragma once

#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace eventstore::domain {

/**
 * @brief Сериализованное событие - то, что лежит в строке domain_events
 */
struct EventData {
    std::string eventId;
    std::string eventType;
    std::optional<std::string> aggregateId;
    std::string aggregateType;
    Timestamp occurredOn;
    nlohmann::json payload = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
};

} // namespace eventstore::domain
