// include/domain/events/DomainEventFactory.hpp
#pragma once

#include "domain/events/DomainEvent.hpp"
#include "domain/events/EventData.hpp"

namespace eventstore::domain {

/**
 * @brief Декодер событий, прочитанных из хранилища
 *
 * Хранилища зависят только от этого контракта, а не от формата событий.
 */
class DomainEventFactory {
public:
    virtual ~DomainEventFactory() = default;

    /**
     * @throws CorruptEventException если тип неизвестен или payload битый
     */
    virtual EventPtr create(const EventData& data) const = 0;
};

} // namespace eventstore::domain
