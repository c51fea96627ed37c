#pragma once

#include "domain/Timestamp.hpp"
#include "domain/events/EventData.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace eventstore::domain {

/**
 * @brief Базовый класс для всех доменных событий
 *
 * Событие неизменяемо после создания: наружу оно отдаётся только как
 * EventPtr (shared_ptr<const DomainEvent>). Поля заполняются конкретным
 * событием до передачи в recordEvent().
 *
 * Кодирование - payload(), декодирование - конструктор из EventData
 * в конкретном событии, зарегистрированный в EventCodecRegistry.
 */
struct DomainEvent {
    std::string eventId;                        ///< UUID события
    std::string eventType;                      ///< Тип события (account.opened, ...)
    std::optional<std::string> aggregateId;     ///< ID агрегата-владельца
    std::string aggregateType;                  ///< Тип агрегата (bank_account), может быть пустым
    Timestamp occurredOn;                       ///< Время возникновения
    nlohmann::json metadata = nlohmann::json::object();

    explicit DomainEvent(const std::string& type)
        : eventId(utils::UuidGenerator::generate())
        , eventType(type)
        , occurredOn(Timestamp::now()) {}

    DomainEvent(const std::string& type,
                const std::string& aggregate,
                const std::string& aggregateTypeName)
        : eventId(utils::UuidGenerator::generate())
        , eventType(type)
        , aggregateId(aggregate)
        , aggregateType(aggregateTypeName)
        , occurredOn(Timestamp::now()) {}

    /// Восстановление полей конверта при декодировании из хранилища
    explicit DomainEvent(const EventData& data)
        : eventId(data.eventId)
        , eventType(data.eventType)
        , aggregateId(data.aggregateId)
        , aggregateType(data.aggregateType)
        , occurredOn(data.occurredOn)
        , metadata(data.metadata.is_null() ? nlohmann::json::object() : data.metadata) {}

    DomainEvent(const DomainEvent&) = default;
    DomainEvent& operator=(const DomainEvent&) = default;
    virtual ~DomainEvent() = default;

    /**
     * @brief Полезная нагрузка события (JSON-объект)
     */
    virtual nlohmann::json payload() const = 0;

    virtual std::unique_ptr<DomainEvent> clone() const = 0;

    /**
     * @brief Сериализованная форма для записи в хранилище
     */
    EventData toEventData() const {
        EventData data;
        data.eventId = eventId;
        data.eventType = eventType;
        data.aggregateId = aggregateId;
        data.aggregateType = aggregateType;
        data.occurredOn = occurredOn;
        data.payload = payload();
        data.metadata = metadata;
        return data;
    }

    /**
     * @brief Копия события с дополненными метаданными
     *
     * Существующие ключи перезаписываются значениями из extra.
     */
    std::shared_ptr<const DomainEvent> withMetadata(const nlohmann::json& extra) const {
        std::shared_ptr<DomainEvent> copy = clone();
        for (const auto& item : extra.items()) {
            copy->metadata[item.key()] = item.value();
        }
        return copy;
    }

    bool hasAggregateId() const {
        return aggregateId.has_value() && !aggregateId->empty();
    }
};

using EventPtr = std::shared_ptr<const DomainEvent>;

} // namespace eventstore::domain
