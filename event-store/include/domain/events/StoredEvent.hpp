#pragma once

#include "domain/events/DomainEvent.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <string>

namespace eventstore::domain {

/**
 * @brief Конверт сохранённого события
 *
 * sequenceNumber - глобальный, строго возрастающий номер в журнале.
 * aggregateVersion - номер события внутри своего агрегата (1..N),
 * для событий без агрегата всегда 1.
 */
struct StoredEvent {
    int64_t sequenceNumber = 0;
    int64_t aggregateVersion = 0;
    EventPtr event;
    Timestamp storedAt;

    const std::string& getEventId() const { return event->eventId; }
    const std::string& getEventType() const { return event->eventType; }
    const Timestamp& getOccurredOn() const { return event->occurredOn; }

    /**
     * @brief JSON-представление для консольного вывода
     */
    nlohmann::json toJson() const {
        nlohmann::json j;
        j["sequenceNumber"] = sequenceNumber;
        j["aggregateVersion"] = aggregateVersion;
        j["storedAt"] = storedAt.toString();
        j["eventId"] = event->eventId;
        j["eventType"] = event->eventType;
        j["aggregateId"] = event->aggregateId ? nlohmann::json(*event->aggregateId) : nlohmann::json();
        j["occurredOn"] = event->occurredOn.toString();
        j["payload"] = event->payload();
        j["metadata"] = event->metadata;
        return j;
    }
};

} // namespace eventstore::domain
