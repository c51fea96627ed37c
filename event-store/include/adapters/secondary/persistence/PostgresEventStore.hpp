#pragma once

#include "ports/output/IEventStore.hpp"
#include "domain/events/DomainEventFactory.hpp"
#include "settings/DbSettings.hpp"
#include "settings/EventStoreSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <string>

namespace eventstore::adapters::secondary {

/**
 * @brief PostgreSQL реализация журнала событий (таблица domain_events)
 *
 * Каждая операция открывает своё соединение, поэтому разные агрегаты
 * пишутся параллельно. Версия назначается внутри вставляющей транзакции
 * под pg_advisory_xact_lock(hashtext(aggregate_id)); уникальный индекс
 * (aggregate_id, version) страхует от гонки, нарушение повторяется
 * до appendRetries раз и затем превращается в ConcurrencyConflictException.
 *
 * Ошибки libpqxx наружу не выходят: соединение и SQL → StorageUnavailableException.
 */
class PostgresEventStore : public ports::output::IEventStore {
public:
    PostgresEventStore(
        std::shared_ptr<settings::DbSettings> dbSettings,
        std::shared_ptr<settings::EventStoreSettings> storeSettings,
        std::shared_ptr<domain::DomainEventFactory> decoder
    );

    domain::StoredEvent append(domain::EventPtr event) override;

    std::vector<domain::StoredEvent> appendAll(
        const std::vector<domain::EventPtr>& events
    ) override;

    std::vector<domain::StoredEvent> appendAll(
        const std::vector<domain::EventPtr>& events,
        int64_t expectedVersion
    ) override;

    std::vector<domain::EventPtr> getEventsForAggregate(const std::string& aggregateId) override;

    std::vector<domain::EventPtr> getEventsForAggregateFromVersion(
        const std::string& aggregateId,
        int64_t fromVersion
    ) override;

    std::vector<domain::EventPtr> getEventsByType(const std::string& eventType) override;
    std::vector<domain::EventPtr> getEventsAfter(const domain::Timestamp& date) override;

    std::vector<domain::EventPtr> getEventsBetween(
        const domain::Timestamp& from,
        const domain::Timestamp& to
    ) override;

    std::vector<domain::StoredEvent> getAllEvents(int64_t afterSequence, size_t limit) override;
    std::vector<domain::StoredEvent> getLatestEvents(size_t limit) override;

    int64_t getAggregateVersion(const std::string& aggregateId) override;
    size_t count() override;
    size_t countForAggregate(const std::string& aggregateId) override;

private:
    /**
     * @brief Вставка с повтором при гонке версий
     *
     * @param expectedVersion -1 - без оптимистической проверки
     */
    std::vector<domain::StoredEvent> appendWithRetry(
        const std::vector<domain::EventPtr>& events,
        int64_t expectedVersion
    );

    std::vector<domain::StoredEvent> insertBatch(
        pqxx::work& txn,
        const std::vector<domain::EventPtr>& events,
        int64_t expectedVersion
    );

    /**
     * @brief SELECT конвертов с декодированием; определяется в .cpp
     */
    template <typename... Args>
    std::vector<domain::StoredEvent> queryStored(const char* operation,
                                                 const std::string& sql,
                                                 Args&&... args);

    template <typename... Args>
    std::vector<domain::EventPtr> queryEvents(const char* operation,
                                              const std::string& sql,
                                              Args&&... args);

    domain::StoredEvent rowToStoredEvent(const pqxx::row& row) const;

    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<domain::DomainEventFactory> decoder_;
    int appendRetries_;
};

} // namespace eventstore::adapters::secondary
