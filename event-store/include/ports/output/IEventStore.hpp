#pragma once

#include "domain/events/DomainEvent.hpp"
#include "domain/events/StoredEvent.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace eventstore::ports::output {

/**
 * @brief Интерфейс хранилища событий (append-only журнал)
 *
 * Output Port. Версия агрегата назначается на стороне хранилища:
 * два конкурентных append для одного агрегата никогда не получают
 * одинаковую версию.
 *
 * Реализации:
 * - InMemoryEventStore - события в памяти (тесты, demo)
 * - PostgresEventStore - таблица domain_events
 *
 * Все методы бросают StorageUnavailableException при недоступности
 * носителя и CorruptEventException, если прочитанное событие не декодируется.
 */
class IEventStore {
public:
    virtual ~IEventStore() = default;

    /**
     * @brief Добавить событие
     *
     * Версия = getAggregateVersion(aggregateId) + 1; событие без агрегата
     * получает версию 1.
     *
     * @return Конверт с sequenceNumber и версией
     * @throws DuplicateEventException если eventId уже есть в журнале
     */
    virtual domain::StoredEvent append(domain::EventPtr event) = 0;

    /**
     * @brief Добавить пачку событий атомарно (всё или ничего)
     *
     * Версии и sequence назначаются в порядке входного вектора.
     */
    virtual std::vector<domain::StoredEvent> appendAll(
        const std::vector<domain::EventPtr>& events
    ) = 0;

    /**
     * @brief Атомарная запись с оптимистической проверкой версии
     *
     * Все события должны принадлежать одному агрегату.
     *
     * @param expectedVersion Версия агрегата, на которой он был загружен
     * @throws ConcurrencyConflictException если текущая версия отличается
     * @throws std::invalid_argument если события разных агрегатов
     */
    virtual std::vector<domain::StoredEvent> appendAll(
        const std::vector<domain::EventPtr>& events,
        int64_t expectedVersion
    ) = 0;

    /**
     * @brief Все события агрегата по возрастанию версии
     */
    virtual std::vector<domain::EventPtr> getEventsForAggregate(const std::string& aggregateId) = 0;

    /**
     * @brief События агрегата с версией > fromVersion
     */
    virtual std::vector<domain::EventPtr> getEventsForAggregateFromVersion(
        const std::string& aggregateId,
        int64_t fromVersion
    ) = 0;

    /**
     * @brief События заданного типа в порядке записи
     */
    virtual std::vector<domain::EventPtr> getEventsByType(const std::string& eventType) = 0;

    /**
     * @brief События с occurredOn > date, в порядке записи
     */
    virtual std::vector<domain::EventPtr> getEventsAfter(const domain::Timestamp& date) = 0;

    /**
     * @brief События с from <= occurredOn <= to, в порядке записи
     */
    virtual std::vector<domain::EventPtr> getEventsBetween(
        const domain::Timestamp& from,
        const domain::Timestamp& to
    ) = 0;

    /**
     * @brief Страница журнала: конверты с sequenceNumber > afterSequence
     *
     * Используется для постраничного перестроения проекций.
     *
     * @param afterSequence Последний обработанный номер (0 - с начала)
     * @param limit Максимальный размер страницы
     */
    virtual std::vector<domain::StoredEvent> getAllEvents(int64_t afterSequence, size_t limit) = 0;

    /**
     * @brief Последние limit конвертов журнала, по возрастанию sequence
     */
    virtual std::vector<domain::StoredEvent> getLatestEvents(size_t limit) = 0;

    /**
     * @brief Текущая (максимальная) версия агрегата, 0 если событий нет
     */
    virtual int64_t getAggregateVersion(const std::string& aggregateId) = 0;

    virtual size_t count() = 0;

    virtual size_t countForAggregate(const std::string& aggregateId) = 0;
};

} // namespace eventstore::ports::output
