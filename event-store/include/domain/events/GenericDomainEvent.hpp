#pragma once

#include "domain/events/DomainEvent.hpp"
#include <nlohmann/json.hpp>

namespace eventstore::domain {

/**
 * @brief Событие неизвестного типа, сохранённое как есть
 *
 * Создаётся декодером только в режиме tolerateUnknownTypes. Агрегаты
 * и проекторы не имеют для него обработчика, поэтому при replay оно
 * меняет лишь версию.
 */
struct GenericDomainEvent : public DomainEvent {
    nlohmann::json rawPayload;

    explicit GenericDomainEvent(const EventData& data)
        : DomainEvent(data)
        , rawPayload(data.payload) {}

    nlohmann::json payload() const override {
        return rawPayload;
    }

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<GenericDomainEvent>(*this);
    }
};

} // namespace eventstore::domain
